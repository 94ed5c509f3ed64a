//  kimport
//  Kubernetes Object Import & Typed Conversion
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "kimport.hh"

namespace kimport {

  // In-process stand-in for a cluster, loaded from a single YAML document:
  //
  //   unreachable: false        # optional, simulates a dead API server
  //   kinds:
  //     - apiVersion: apps/v1
  //       kind: Deployment
  //       resource: deployments
  //       namespaced: true
  //       schema: { object: { ... }, optional: [ ... ] }
  //   objects:
  //     - { apiVersion: apps/v1, kind: Deployment, metadata: { ... }, ... }
  //
  // Serves all three collaborator interfaces of the Importer.
  class Catalog : public TypeRegistry, public ObjectStore,
    public SchemaRegistry
  {
  public:
    explicit Catalog( const ordered_node& doc );

    static Catalog load( std::istream& in );
    static Catalog from_text( const std::string& text );

    std::optional< EndpointDescriptor >
      lookup_endpoint( const GroupVersionKind& gvk ) override;

    std::optional< bool >
      is_namespace_scoped( const GroupVersionKind& gvk ) override;

    std::optional< ordered_node > get( const EndpointDescriptor& ep,
      const std::optional< std::string >& ns, const std::string& name,
      const CancelToken& cancel ) override;

    SchemaPtr schema_for( const GroupVersionKind& gvk ) override;

    void set_unreachable( bool unreachable ) { unreachable_ = unreachable; }

    size_t kind_count() const { return kinds_.size(); }
    size_t object_count() const { return objects_.size(); }

  private:
    struct KindEntry {
      EndpointDescriptor endpoint;
      bool namespaced = false;
      SchemaPtr schema; // may be null: kind served without a definition
    };

    static std::string object_key( const EndpointDescriptor& ep,
      const std::string& ns, const std::string& name );

    void load_kind( const ordered_node& k, size_t idx );
    void load_object( const ordered_node& o, size_t idx );

    void check_reachable( const std::string& what ) const;

    std::unordered_map< GroupVersionKind, KindEntry,
      GroupVersionKindHash > kinds_;

    // object_key -> live object
    std::map< std::string, ordered_node > objects_;

    bool unreachable_ = false;
  };

namespace internal {

  inline const std::string CATALOG_KINDS = "kinds";
  inline const std::string CATALOG_OBJECTS = "objects";
  inline const std::string CATALOG_UNREACHABLE = "unreachable";

  // Fetch a required string field from a catalog entry
  inline std::string required_string( const ordered_node& entry,
    const std::string& key, const std::string& where )
  {
    if ( !entry.is_mapping() || !entry.contains(key)
      || !entry.at(key).is_string() )
    {
      throw std::runtime_error( where + ": missing string field '"
        + key + "'" );
    }
    return to_native_checked< std::string >( entry.at(key) );
  }

} // namespace kimport::internal

} // namespace kimport

inline kimport::Catalog::Catalog( const ordered_node& doc ) {
  if ( !doc.is_mapping() ) {
    throw std::runtime_error( "catalog: document root must be a mapping" );
  }

  if ( doc.contains(internal::CATALOG_UNREACHABLE) ) {
    const ordered_node& u = doc.at( internal::CATALOG_UNREACHABLE );
    if ( !u.is_boolean() ) {
      throw std::runtime_error( "catalog: '"
        + internal::CATALOG_UNREACHABLE + "' must be a boolean" );
    }
    unreachable_ = u.get_value< bool >();
  }

  // Kinds first, objects refer to them
  if ( doc.contains(internal::CATALOG_KINDS) ) {
    const ordered_node& kinds = doc.at( internal::CATALOG_KINDS );
    if ( !kinds.is_sequence() ) {
      throw std::runtime_error( "catalog: 'kinds' must be a sequence" );
    }
    for ( size_t i = 0; i < kinds.size(); ++i ) {
      this->load_kind( kinds.at(i), i );
    }
  }

  if ( doc.contains(internal::CATALOG_OBJECTS) ) {
    const ordered_node& objects = doc.at( internal::CATALOG_OBJECTS );
    if ( !objects.is_sequence() ) {
      throw std::runtime_error( "catalog: 'objects' must be a sequence" );
    }
    for ( size_t i = 0; i < objects.size(); ++i ) {
      this->load_object( objects.at(i), i );
    }
  }

  spdlog::debug( "catalog: loaded {} kinds and {} objects", kinds_.size(),
    objects_.size() );
}

// Read from an input stream until end-of-file, then parse the result
inline kimport::Catalog kimport::Catalog::load( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return from_text( ss.str() );
}

inline kimport::Catalog kimport::Catalog::from_text( const std::string& text )
{
  return Catalog( ordered_node::deserialize(text) );
}

inline std::string kimport::Catalog::object_key( const EndpointDescriptor& ep,
  const std::string& ns, const std::string& name )
{
  return ep.group + '/' + ep.version + '/' + ep.resource + '/' + ns
    + '/' + name;
}

inline void kimport::Catalog::load_kind( const ordered_node& k, size_t idx ) {
  const std::string where = "catalog: kinds[" + std::to_string( idx ) + ']';
  const std::string api_version = internal::required_string( k,
    "apiVersion", where );
  const std::string kind = internal::required_string( k, "kind", where );

  KindEntry entry;
  const GroupVersionKind gvk
    = internal::gvk_from_api_version_and_kind( api_version, kind );
  entry.endpoint.group = gvk.group;
  entry.endpoint.version = gvk.version;
  entry.endpoint.resource = internal::required_string( k, "resource", where );

  if ( k.contains("namespaced") ) {
    if ( !k.at("namespaced").is_boolean() ) {
      throw std::runtime_error( where + ": 'namespaced' must be a boolean" );
    }
    entry.namespaced = k.at( "namespaced" ).get_value< bool >();
  }

  if ( k.contains("schema") ) {
    entry.schema = schema_from_node( k.at("schema"), gvk.kind );
  }

  if ( !kinds_.emplace( gvk, std::move(entry) ).second ) {
    throw std::runtime_error( where + ": duplicate kind "
      + gvk.to_string() );
  }
}

inline void kimport::Catalog::load_object( const ordered_node& o, size_t idx )
{
  const std::string where = "catalog: objects[" + std::to_string( idx ) + ']';
  const GroupVersionKind gvk = internal::gvk_from_api_version_and_kind(
    internal::required_string( o, "apiVersion", where ),
    internal::required_string( o, "kind", where ) );

  auto it = kinds_.find( gvk );
  if ( it == kinds_.end() ) {
    throw std::runtime_error( where + ": undeclared kind " + gvk.to_string() );
  }

  if ( !o.contains(internal::METADATA) ) {
    throw std::runtime_error( where + ": missing 'metadata'" );
  }
  const ordered_node& meta = o.at( internal::METADATA );
  const std::string name = internal::required_string( meta, "name", where );
  std::string ns;
  if ( it->second.namespaced ) {
    ns = internal::required_string( meta, "namespace", where );
  }

  objects_[ object_key(it->second.endpoint, ns, name) ] = o;
}

inline void kimport::Catalog::check_reachable( const std::string& what ) const
{
  if ( unreachable_ ) {
    throw RemoteUnavailable( what + ": connection refused" );
  }
}

inline std::optional< kimport::EndpointDescriptor >
  kimport::Catalog::lookup_endpoint( const GroupVersionKind& gvk )
{
  this->check_reachable( "lookup " + gvk.to_string() );
  auto it = kinds_.find( gvk );
  if ( it == kinds_.end() ) return std::nullopt;
  return it->second.endpoint;
}

inline std::optional< bool > kimport::Catalog::is_namespace_scoped(
  const GroupVersionKind& gvk )
{
  this->check_reachable( "scope " + gvk.to_string() );
  auto it = kinds_.find( gvk );
  if ( it == kinds_.end() ) return std::nullopt;
  return it->second.namespaced;
}

inline std::optional< kimport::ordered_node > kimport::Catalog::get(
  const EndpointDescriptor& ep, const std::optional< std::string >& ns,
  const std::string& name, const CancelToken& cancel )
{
  cancel.check( "get " + ep.resource + "/" + name );
  this->check_reachable( "get " + ep.resource + "/" + name );

  auto it = objects_.find( object_key(ep, ns.value_or(""), name) );
  if ( it == objects_.end() ) return std::nullopt;
  return it->second;
}

inline kimport::SchemaPtr kimport::Catalog::schema_for(
  const GroupVersionKind& gvk )
{
  this->check_reachable( "schema " + gvk.to_string() );
  auto it = kinds_.find( gvk );
  if ( it == kinds_.end() ) return nullptr;
  return it->second.schema;
}
