//  kimport
//  Kubernetes Object Import & Typed Conversion
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

// spdlog logging library
// https://github.com/gabime/spdlog
#include <spdlog/spdlog.h>

namespace kimport {

  // Specialized version of the fkYAML basic_node template. The choice of
  // fkyaml::ordered_map preserves the key order of objects returned by the
  // remote store
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

namespace internal {

  // Constants defining identifier syntax and the well-known object keys used
  // by the import pipeline. Kept in one block for easy editing.
  inline constexpr char ID_SEPARATOR = '#';
  inline constexpr char GROUP_VERSION_SEPARATOR = '/';
  inline constexpr char PATH_DELIMITER = '.';

  inline const std::string METADATA = "metadata";
  inline const std::string STATUS = "status";

  // Metadata fields populated and owned by the remote system
  inline const std::vector< std::string > SERVER_METADATA_FIELDS = {
    "uid", "creationTimestamp", "resourceVersion", "generation",
    "selfLink", "managedFields"
  };

  // Slots of the persisted import state
  inline const std::string MANIFEST = "manifest";
  inline const std::string OBJECT = "object";
  inline const std::string WAIT_FOR = "wait_for";
  inline const std::string WAIT_FOR_FIELDS = "fields";

  // Resource type served by the importer
  inline const std::string MANIFEST_RESOURCE_TYPE = "kubernetes_manifest";

  // YAML tags used when flattening non-concrete values
  inline const std::string UNKNOWN_TAG = "!unknown";
  inline const std::string ABSENT_TAG = "!absent";

} // namespace kimport::internal

  // Error categories reported by the pipeline
  enum class ErrorKind {
    Parse,               // malformed import identifier
    TypeUnknown,         // type registry does not serve the group/version/kind
    RegistryUnreachable, // type registry could not be contacted
    NotFound,            // remote object does not exist
    Transport,           // remote store failure while reading the object
    Canceled,            // caller canceled or the fetch deadline passed
    Schema,              // no usable schema for the type
    Conversion,          // raw data incompatible with the schema
    Assembly             // internal invariant violated while packaging
  };

  std::string to_string( ErrorKind kind );

  // Base class for every error raised by the pipeline stages
  class ImportError : public std::runtime_error {
  public:
    ImportError( ErrorKind kind, const std::string& msg )
      : std::runtime_error( msg ), kind_( kind ) {}

    ErrorKind kind() const { return kind_; }

  private:
    ErrorKind kind_;
  };

  class ParseError : public ImportError {
  public:
    explicit ParseError( const std::string& msg )
      : ImportError( ErrorKind::Parse, msg ) {}
  };

  // kind() is either TypeUnknown or RegistryUnreachable
  class ResolutionError : public ImportError {
  public:
    ResolutionError( ErrorKind kind, const std::string& msg )
      : ImportError( kind, msg ) {}
  };

  // kind() is either NotFound or Transport
  class FetchError : public ImportError {
  public:
    FetchError( ErrorKind kind, const std::string& msg )
      : ImportError( kind, msg ) {}
  };

  class Canceled : public ImportError {
  public:
    explicit Canceled( const std::string& msg )
      : ImportError( ErrorKind::Canceled, msg ) {}
  };

  class SchemaError : public ImportError {
  public:
    explicit SchemaError( const std::string& msg )
      : ImportError( ErrorKind::Schema, msg ) {}
  };

  // Conversion failure at an attribute path. Steps are prepended by each
  // level of the recursion as it unwinds, so the final message reads
  // "spec.containers[0].image: <reason>".
  class ConversionError : public ImportError {
  public:
    explicit ConversionError( const std::string& reason )
      : ImportError( ErrorKind::Conversion, reason ), reason_( reason ),
      message_( reason ) {}

    // Step is an attribute name, "[i]" or "[\"key\"]"
    void prepend( const std::string& step );

    std::string path() const;
    const std::string& reason() const { return reason_; }

    const char* what() const noexcept override { return message_.c_str(); }

  private:
    std::vector< std::string > steps_; // outermost first
    std::string reason_;
    std::string message_;
  };

  class AssemblyError : public ImportError {
  public:
    explicit AssemblyError( const std::string& msg )
      : ImportError( ErrorKind::Assembly, msg ) {}
  };

  // Thrown by collaborators when the remote side cannot be reached
  class RemoteUnavailable : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  struct GroupVersionKind {
    std::string group;
    std::string version;
    std::string kind;

    // "group/version", or just "version" for the core group
    std::string api_version() const;

    // e.g., "apps/v1, Kind=Deployment"
    std::string to_string() const;

    bool operator==( const GroupVersionKind& o ) const {
      return group == o.group && version == o.version && kind == o.kind;
    }
    bool operator!=( const GroupVersionKind& o ) const {
      return !( *this == o );
    }
  };

  struct GroupVersionKindHash {
    std::size_t operator()( const GroupVersionKind& gvk ) const;
  };

  struct ResourceIdentity {
    GroupVersionKind gvk;
    std::optional< std::string > ns; // present only for 4-segment ids
    std::string name;

    std::string to_string() const;
  };

  // Where objects of a resolved type are read from
  struct EndpointDescriptor {
    std::string group;
    std::string version;
    std::string resource; // plural resource name, e.g., "deployments"

    std::string to_string() const;
  };

  // Cooperative cancellation with an optional deadline. A token may be
  // linked to a parent token, in which case canceling the parent cancels
  // the child as well.
  class CancelToken {
  public:
    using clock = std::chrono::steady_clock;

    CancelToken() = default;
    explicit CancelToken( const CancelToken* parent,
      std::optional< clock::time_point > deadline = std::nullopt )
      : parent_( parent ), deadline_( deadline ) {}

    CancelToken( const CancelToken& ) = delete;
    CancelToken& operator=( const CancelToken& ) = delete;

    void cancel() { canceled_.store( true ); }

    bool is_canceled() const;
    bool deadline_exceeded() const;

    // Throws Canceled if this token (or an ancestor) is canceled or expired
    void check( const std::string& what ) const;

  private:
    const CancelToken* parent_ = nullptr;
    std::optional< clock::time_point > deadline_;
    std::atomic< bool > canceled_{ false };
  };

  // Schema model

  enum class SchemaShape { Scalar, Object, List, Map, Set };
  enum class ScalarKind { String, Number, Bool, Dynamic };

  class FieldSchema;
  using SchemaPtr = std::shared_ptr< const FieldSchema >;

  // Recursive description of the expected shape of a value. Instances are
  // immutable and shared between cached schemas and the values typed by them.
  class FieldSchema {
  public:
    using Attributes = std::map< std::string, SchemaPtr >;

    static SchemaPtr scalar( ScalarKind kind );
    // String scalar that also accepts raw integers
    static SchemaPtr int_or_string();
    static SchemaPtr object( Attributes attributes,
      std::set< std::string > optional = {} );
    static SchemaPtr list( SchemaPtr element );
    static SchemaPtr map( SchemaPtr element );
    static SchemaPtr set( SchemaPtr element );

    SchemaShape shape() const { return shape_; }
    ScalarKind scalar_kind() const { return scalar_kind_; }
    bool accepts_integer_as_string() const { return int_or_string_; }

    // Element schema for lists and sets, value schema for maps
    const SchemaPtr& element() const { return element_; }

    const Attributes& attributes() const { return attributes_; }
    const std::set< std::string >& optional() const { return optional_; }
    bool is_optional( const std::string& name ) const {
      return optional_.count( name ) > 0;
    }

    bool is_collection() const {
      return shape_ == SchemaShape::List || shape_ == SchemaShape::Set
        || shape_ == SchemaShape::Map;
    }

    // Compact single-line rendering, e.g., "object{name: string, tags?:
    // list(string)}"
    std::string to_string() const;

    bool operator==( const FieldSchema& o ) const;
    bool operator!=( const FieldSchema& o ) const { return !( *this == o ); }

  private:
    FieldSchema() = default;

    SchemaShape shape_ = SchemaShape::Scalar;
    ScalarKind scalar_kind_ = ScalarKind::String;
    bool int_or_string_ = false;
    SchemaPtr element_;
    Attributes attributes_;
    std::set< std::string > optional_;
  };

  // Build a FieldSchema from its YAML notation:
  //   string | number | bool | dynamic | int-or-string
  //   { list: S } | { set: S } | { map: S }
  //   { object: { name: S, ... }, optional: [ name, ... ] }
  SchemaPtr schema_from_node( const ordered_node& n,
    const std::string& path = "schema" );

  // Typed values

  enum class ValueState {
    Known,   // concrete value of the declared shape
    Absent,  // converter could not determine a value here
    Pending, // value to be computed later
    Null     // explicit absence
  };

  using Scalar = std::variant< bool, std::int64_t, double, std::string >;

  // Value tree shaped by a FieldSchema at every node
  class TypedValue {
  public:
    using Elements = std::vector< TypedValue >;
    using Fields = std::map< std::string, TypedValue >;

    static TypedValue scalar( SchemaPtr type, Scalar value );
    static TypedValue dynamic( SchemaPtr type, ordered_node raw );
    // Lists and sets
    static TypedValue sequence( SchemaPtr type, Elements elements );
    static TypedValue map( SchemaPtr type, Fields entries );
    static TypedValue object( SchemaPtr type, Fields attributes );

    static TypedValue absent( SchemaPtr type );
    static TypedValue pending( SchemaPtr type );
    static TypedValue null( SchemaPtr type );

    const SchemaPtr& type() const { return type_; }
    ValueState state() const { return state_; }
    bool is_known() const { return state_ == ValueState::Known; }
    bool is_absent() const { return state_ == ValueState::Absent; }
    bool is_pending() const { return state_ == ValueState::Pending; }
    bool is_null() const { return state_ == ValueState::Null; }

    const Scalar& scalar_value() const { return scalar_; }
    const ordered_node& dynamic_value() const { return dynamic_; }
    const Elements& elements() const { return elements_; }
    // Map entries or object attributes
    const Fields& fields() const { return fields_; }

    const TypedValue* find( const std::string& key ) const;

    // True if this node or any descendant is in the given state
    bool contains_state( ValueState s ) const;

    // Flatten into a plain YAML node. Pending and Absent become nulls
    // tagged UNKNOWN_TAG and ABSENT_TAG respectively.
    ordered_node to_node() const;

    bool operator==( const TypedValue& o ) const;
    bool operator!=( const TypedValue& o ) const { return !( *this == o ); }

  private:
    TypedValue( SchemaPtr type, ValueState state )
      : type_( std::move(type) ), state_( state ) {}

    SchemaPtr type_;
    ValueState state_;
    Scalar scalar_;
    ordered_node dynamic_;
    Elements elements_;
    Fields fields_;
  };

  // External collaborators

  // Maps a group/version/kind to its endpoint and scope
  class TypeRegistry {
  public:
    virtual ~TypeRegistry() = default;

    // std::nullopt when the type is not served. Throws RemoteUnavailable
    // when the registry cannot be reached.
    virtual std::optional< EndpointDescriptor >
      lookup_endpoint( const GroupVersionKind& gvk ) = 0;

    virtual std::optional< bool >
      is_namespace_scoped( const GroupVersionKind& gvk ) = 0;
  };

  // Reads live objects
  class ObjectStore {
  public:
    virtual ~ObjectStore() = default;

    // std::nullopt when the object does not exist. Throws RemoteUnavailable
    // on transport failure and Canceled when the token fires.
    virtual std::optional< ordered_node > get( const EndpointDescriptor& ep,
      const std::optional< std::string >& ns, const std::string& name,
      const CancelToken& cancel ) = 0;
  };

  // Describes the typed shape of a group/version/kind
  class SchemaRegistry {
  public:
    virtual ~SchemaRegistry() = default;

    // nullptr when there is no definition for the type
    virtual SchemaPtr schema_for( const GroupVersionKind& gvk ) = 0;
  };

  // Pipeline stages

  // Split "<group/version>#<Kind>#[<namespace>#]<name>"
  ResourceIdentity parse_import_id( const std::string& id );

  struct Resolution {
    EndpointDescriptor endpoint;
    bool namespaced = false;
    // Set when the scope of the type disagrees with the identifier
    std::optional< std::string > scope_mismatch;
  };

  class TypeResolver {
  public:
    explicit TypeResolver( TypeRegistry& registry ) : registry_( registry ) {}

    Resolution resolve( const ResourceIdentity& id );

  private:
    TypeRegistry& registry_;
  };

  class ObjectFetcher {
  public:
    explicit ObjectFetcher( ObjectStore& store ) : store_( store ) {}

    ordered_node fetch( const EndpointDescriptor& ep,
      const ResourceIdentity& id, bool namespaced,
      const CancelToken& cancel );

  private:
    ObjectStore& store_;
  };

  // Drop status and server-generated metadata
  ordered_node remove_server_side_fields( const ordered_node& obj );

  // Process-wide schema cache keyed by group/version/kind. Entries are never
  // evicted or replaced once populated.
  class SchemaCache {
  public:
    SchemaPtr find( const GroupVersionKind& gvk ) const;

    // Returns the cached entry, which is the given schema unless another
    // thread populated the key first
    SchemaPtr insert( const GroupVersionKind& gvk, SchemaPtr schema );

    std::size_t size() const;

  private:
    mutable std::shared_mutex mutex_;
    std::unordered_map< GroupVersionKind, SchemaPtr,
      GroupVersionKindHash > entries_;
  };

  class SchemaResolver {
  public:
    SchemaResolver( SchemaRegistry& registry, SchemaCache& cache )
      : registry_( registry ), cache_( cache ) {}

    SchemaPtr schema_for( const ResourceIdentity& id );

  private:
    SchemaRegistry& registry_;
    SchemaCache& cache_;
  };

  // Schema-directed conversion of raw data. Absent attributes and raw nulls
  // become Absent placeholders; raw attributes without a schema counterpart
  // are dropped.
  TypedValue to_typed_value( const ordered_node& raw, const SchemaPtr& schema );

  // Replace Absent placeholders by Pending values of the declared shape.
  // Lists, sets and maps holding any Pending element become Pending as a
  // whole.
  TypedValue backfill_unknown( const SchemaPtr& schema,
    const TypedValue& value );

  // Outermost object only: optional attributes that are Pending become Null
  TypedValue narrow_top_level( const TypedValue& value );

  // Resource types served by the importer
  struct ResourceType {
    std::string name;
    SchemaPtr schema; // object{manifest, object, wait_for}
  };

  const ResourceType* find_resource_type( const std::string& type_name );

  struct ImportedState {
    TypedValue manifest;
    TypedValue object;
    TypedValue wait_for;

    ordered_node to_node() const;
  };

  ImportedState assemble_imported_state( const ResourceType& rt,
    TypedValue object );

  // Caller-facing results

  enum class Severity { Error, Warning };

  struct Diagnostic {
    Severity severity = Severity::Error;
    std::string summary;
    std::string detail;
  };

  struct ImportedResource {
    std::string type_name;
    ImportedState state;
    ordered_node serialized;
  };

  struct ImportResponse {
    std::vector< Diagnostic > diagnostics;
    std::vector< ImportedResource > imported;

    bool has_errors() const;
  };

  struct ImporterOptions {
    // Deadline for the remote read; zero disables it
    std::chrono::milliseconds fetch_timeout{ 30000 };
    // Turn outermost optional Pending attributes into Null
    bool narrow_top_level = true;
  };

  class Importer {
  public:
    Importer( TypeRegistry& types, ObjectStore& store,
      SchemaRegistry& schemas, SchemaCache& cache,
      ImporterOptions options = ImporterOptions() )
      : types_( types ), store_( store ), schemas_( schemas ),
      cache_( cache ), options_( options ) {}

    // Run the full import for one identifier. Never throws for pipeline
    // failures; they are reported as diagnostics.
    ImportResponse import_resource( const std::string& type_name,
      const std::string& id, const CancelToken* cancel = nullptr );

    const ImporterOptions& options() const { return options_; }

  private:
    TypeRegistry& types_;
    ObjectStore& store_;
    SchemaRegistry& schemas_;
    SchemaCache& cache_;
    ImporterOptions options_;
  };

namespace internal {

  // Divide a string at each instance of the separator. An empty input
  // yields a single empty segment.
  inline std::vector< std::string > split_on( const std::string& s,
    char sep )
  {
    std::vector< std::string > segs;
    size_t start = 0;
    while ( true ) {
      size_t pos = s.find( sep, start );
      if ( pos == std::string::npos ) {
        segs.push_back( s.substr(start) );
        break;
      }
      segs.push_back( s.substr(start, pos - start) );
      start = pos + 1;
    }
    return segs;
  }

  // "apps/v1" -> {apps, v1}; "v1" -> {"", v1}. Anything with more than one
  // separator yields an empty group and version and is rejected later by
  // the type registry.
  inline GroupVersionKind gvk_from_api_version_and_kind(
    const std::string& api_version, const std::string& kind )
  {
    GroupVersionKind gvk;
    gvk.kind = kind;
    const std::vector< std::string > gv
      = split_on( api_version, GROUP_VERSION_SEPARATOR );
    if ( gv.size() == 1 ) {
      gvk.version = gv[ 0 ];
    }
    else if ( gv.size() == 2 ) {
      gvk.group = gv[ 0 ];
      gvk.version = gv[ 1 ];
    }
    return gvk;
  }

  // Path steps used by ConversionError
  inline std::string seq_indexed( size_t idx ) {
    return '[' + std::to_string( idx ) + ']';
  }

  inline std::string key_indexed( const std::string& key ) {
    return "[\"" + key + "\"]";
  }

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return std::to_string(
      to_native_checked< double >( n )
    );

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  // Name of the raw YAML kind of a node, for error messages
  inline std::string raw_kind_name( const ordered_node& n ) {
    if ( n.is_mapping() ) return "mapping";
    if ( n.is_sequence() ) return "sequence";
    if ( n.is_string() ) return "string";
    if ( n.is_integer() ) return "integer";
    if ( n.is_float_number() ) return "float";
    if ( n.is_boolean() ) return "boolean";
    return "null";
  }

  inline ordered_node tagged_null( const std::string& tag ) {
    ordered_node n;
    n.add_tag_name( tag );
    return n;
  }

  [[noreturn]] inline void throw_cannot_convert( const ordered_node& raw,
    const FieldSchema& schema )
  {
    std::ostringstream oss;
    oss << "cannot convert payload from \"" << raw_kind_name( raw )
      << "\" to \"" << schema.to_string() << '\"';
    throw ConversionError( oss.str() );
  }

} // namespace kimport::internal

} // namespace kimport

// Out-of-class definitions

inline std::string kimport::to_string( ErrorKind kind ) {
  switch ( kind ) {
    case ErrorKind::Parse: return "parse";
    case ErrorKind::TypeUnknown: return "type unknown";
    case ErrorKind::RegistryUnreachable: return "registry unreachable";
    case ErrorKind::NotFound: return "not found";
    case ErrorKind::Transport: return "transport";
    case ErrorKind::Canceled: return "canceled";
    case ErrorKind::Schema: return "schema";
    case ErrorKind::Conversion: return "conversion";
    case ErrorKind::Assembly: return "assembly";
  }
  return "unknown";
}

inline void kimport::ConversionError::prepend( const std::string& step ) {
  steps_.insert( steps_.begin(), step );
  const std::string p = this->path();
  message_ = p.empty() ? reason_ : ( p + ": " + reason_ );
}

// Connect path steps, using PATH_DELIMITER between attribute names and no
// delimiter before index steps
inline std::string kimport::ConversionError::path() const {
  std::string s;
  for ( const auto& step : steps_ ) {
    if ( !s.empty() && !step.empty() && step.front() != '[' ) {
      s += internal::PATH_DELIMITER;
    }
    s += step;
  }
  return s;
}

inline std::string kimport::GroupVersionKind::api_version() const {
  if ( group.empty() ) return version;
  return group + internal::GROUP_VERSION_SEPARATOR + version;
}

inline std::string kimport::GroupVersionKind::to_string() const {
  return this->api_version() + ", Kind=" + kind;
}

inline std::size_t kimport::GroupVersionKindHash::operator()(
  const GroupVersionKind& gvk ) const
{
  std::hash< std::string > h;
  std::size_t seed = h( gvk.group );
  seed ^= h( gvk.version ) + 0x9e3779b9 + ( seed << 6 ) + ( seed >> 2 );
  seed ^= h( gvk.kind ) + 0x9e3779b9 + ( seed << 6 ) + ( seed >> 2 );
  return seed;
}

inline std::string kimport::ResourceIdentity::to_string() const {
  std::string s = gvk.to_string() + " ";
  if ( ns ) s += *ns + '/';
  return s + name;
}

inline std::string kimport::EndpointDescriptor::to_string() const {
  std::string s = group.empty() ? version
    : ( group + internal::GROUP_VERSION_SEPARATOR + version );
  return s + ", Resource=" + resource;
}

inline bool kimport::CancelToken::deadline_exceeded() const {
  if ( deadline_ && clock::now() >= *deadline_ ) return true;
  return parent_ && parent_->deadline_exceeded();
}

inline bool kimport::CancelToken::is_canceled() const {
  if ( canceled_.load() ) return true;
  if ( this->deadline_exceeded() ) return true;
  return parent_ && parent_->is_canceled();
}

inline void kimport::CancelToken::check( const std::string& what ) const {
  if ( this->deadline_exceeded() ) {
    throw Canceled( what + ": deadline exceeded" );
  }
  if ( this->is_canceled() ) {
    throw Canceled( what + ": canceled" );
  }
}

// FieldSchema

inline kimport::SchemaPtr kimport::FieldSchema::scalar( ScalarKind kind ) {
  std::shared_ptr< FieldSchema > s( new FieldSchema() );
  s->shape_ = SchemaShape::Scalar;
  s->scalar_kind_ = kind;
  return s;
}

inline kimport::SchemaPtr kimport::FieldSchema::int_or_string() {
  std::shared_ptr< FieldSchema > s( new FieldSchema() );
  s->shape_ = SchemaShape::Scalar;
  s->scalar_kind_ = ScalarKind::String;
  s->int_or_string_ = true;
  return s;
}

inline kimport::SchemaPtr kimport::FieldSchema::object( Attributes attributes,
  std::set< std::string > optional )
{
  for ( const auto& [name, type] : attributes ) {
    if ( !type ) {
      throw SchemaError( "attribute '" + name + "' has no schema" );
    }
  }
  for ( const auto& name : optional ) {
    if ( !attributes.count(name) ) {
      throw SchemaError( "optional attribute '" + name
        + "' is not declared by the object" );
    }
  }
  std::shared_ptr< FieldSchema > s( new FieldSchema() );
  s->shape_ = SchemaShape::Object;
  s->attributes_ = std::move( attributes );
  s->optional_ = std::move( optional );
  return s;
}

inline kimport::SchemaPtr kimport::FieldSchema::list( SchemaPtr element ) {
  if ( !element ) throw SchemaError( "list has no element schema" );
  std::shared_ptr< FieldSchema > s( new FieldSchema() );
  s->shape_ = SchemaShape::List;
  s->element_ = std::move( element );
  return s;
}

inline kimport::SchemaPtr kimport::FieldSchema::map( SchemaPtr element ) {
  if ( !element ) throw SchemaError( "map has no value schema" );
  std::shared_ptr< FieldSchema > s( new FieldSchema() );
  s->shape_ = SchemaShape::Map;
  s->element_ = std::move( element );
  return s;
}

inline kimport::SchemaPtr kimport::FieldSchema::set( SchemaPtr element ) {
  if ( !element ) throw SchemaError( "set has no element schema" );
  std::shared_ptr< FieldSchema > s( new FieldSchema() );
  s->shape_ = SchemaShape::Set;
  s->element_ = std::move( element );
  return s;
}

inline std::string kimport::FieldSchema::to_string() const {
  switch ( shape_ ) {
    case SchemaShape::Scalar:
      if ( int_or_string_ ) return "int-or-string";
      switch ( scalar_kind_ ) {
        case ScalarKind::String: return "string";
        case ScalarKind::Number: return "number";
        case ScalarKind::Bool: return "bool";
        case ScalarKind::Dynamic: return "dynamic";
      }
      return "scalar";
    case SchemaShape::List: return "list(" + element_->to_string() + ')';
    case SchemaShape::Set: return "set(" + element_->to_string() + ')';
    case SchemaShape::Map: return "map(" + element_->to_string() + ')';
    case SchemaShape::Object: {
      std::ostringstream oss;
      oss << "object{";
      bool first = true;
      for ( const auto& [name, type] : attributes_ ) {
        if ( !first ) oss << ", ";
        first = false;
        oss << name << ( this->is_optional(name) ? "?" : "" ) << ": "
          << type->to_string();
      }
      oss << '}';
      return oss.str();
    }
  }
  return "unknown";
}

inline bool kimport::FieldSchema::operator==( const FieldSchema& o ) const {
  if ( shape_ != o.shape_ ) return false;
  switch ( shape_ ) {
    case SchemaShape::Scalar:
      return scalar_kind_ == o.scalar_kind_
        && int_or_string_ == o.int_or_string_;
    case SchemaShape::List:
    case SchemaShape::Set:
    case SchemaShape::Map:
      return *element_ == *o.element_;
    case SchemaShape::Object:
      if ( optional_ != o.optional_ ) return false;
      if ( attributes_.size() != o.attributes_.size() ) return false;
      for ( const auto& [name, type] : attributes_ ) {
        auto it = o.attributes_.find( name );
        if ( it == o.attributes_.end() || *type != *it->second ) return false;
      }
      return true;
  }
  return false;
}

inline kimport::SchemaPtr kimport::schema_from_node( const ordered_node& n,
  const std::string& path )
{
  if ( n.is_string() ) {
    const std::string k = internal::to_native_checked< std::string >( n );
    if ( k == "string" ) return FieldSchema::scalar( ScalarKind::String );
    if ( k == "number" ) return FieldSchema::scalar( ScalarKind::Number );
    if ( k == "bool" ) return FieldSchema::scalar( ScalarKind::Bool );
    if ( k == "dynamic" ) return FieldSchema::scalar( ScalarKind::Dynamic );
    if ( k == "int-or-string" ) return FieldSchema::int_or_string();
    throw SchemaError( path + ": unknown scalar kind '" + k + "'" );
  }

  if ( !n.is_mapping() ) {
    throw SchemaError( path + ": expected a scalar kind or a mapping, found "
      + internal::raw_kind_name(n) );
  }

  if ( n.contains("list") ) {
    return FieldSchema::list( schema_from_node(n.at("list"), path + "[]") );
  }
  if ( n.contains("set") ) {
    return FieldSchema::set( schema_from_node(n.at("set"), path + "[]") );
  }
  if ( n.contains("map") ) {
    return FieldSchema::map( schema_from_node(n.at("map"), path + "[*]") );
  }
  if ( n.contains("object") ) {
    const ordered_node& attrs = n.at( "object" );
    if ( !attrs.is_mapping() ) {
      throw SchemaError( path + ": 'object' must be a mapping of attributes" );
    }

    FieldSchema::Attributes attributes;
    for ( const auto& [mk, mv] : attrs.map_items() ) {
      const std::string name = internal::to_string_any( mk );
      attributes[ name ] = schema_from_node( mv,
        path + internal::PATH_DELIMITER + name );
    }

    std::set< std::string > optional;
    if ( n.contains("optional") ) {
      const ordered_node& opt = n.at( "optional" );
      if ( !opt.is_sequence() ) {
        throw SchemaError( path + ": 'optional' must be a sequence of names" );
      }
      for ( const auto& name_node : opt ) {
        const std::string name = internal::to_string_any( name_node );
        if ( !attributes.count(name) ) {
          throw SchemaError( path + ": optional attribute '" + name
            + "' is not declared" );
        }
        optional.insert( name );
      }
    }
    return FieldSchema::object( std::move(attributes), std::move(optional) );
  }

  throw SchemaError( path
    + ": mapping must contain one of 'list', 'set', 'map' or 'object'" );
}

// TypedValue

inline kimport::TypedValue kimport::TypedValue::scalar( SchemaPtr type,
  Scalar value )
{
  TypedValue v( std::move(type), ValueState::Known );
  v.scalar_ = std::move( value );
  return v;
}

inline kimport::TypedValue kimport::TypedValue::dynamic( SchemaPtr type,
  ordered_node raw )
{
  TypedValue v( std::move(type), ValueState::Known );
  v.dynamic_ = std::move( raw );
  return v;
}

inline kimport::TypedValue kimport::TypedValue::sequence( SchemaPtr type,
  Elements elements )
{
  TypedValue v( std::move(type), ValueState::Known );
  v.elements_ = std::move( elements );
  return v;
}

inline kimport::TypedValue kimport::TypedValue::map( SchemaPtr type,
  Fields entries )
{
  TypedValue v( std::move(type), ValueState::Known );
  v.fields_ = std::move( entries );
  return v;
}

inline kimport::TypedValue kimport::TypedValue::object( SchemaPtr type,
  Fields attributes )
{
  TypedValue v( std::move(type), ValueState::Known );
  v.fields_ = std::move( attributes );
  return v;
}

inline kimport::TypedValue kimport::TypedValue::absent( SchemaPtr type ) {
  return TypedValue( std::move(type), ValueState::Absent );
}

inline kimport::TypedValue kimport::TypedValue::pending( SchemaPtr type ) {
  return TypedValue( std::move(type), ValueState::Pending );
}

inline kimport::TypedValue kimport::TypedValue::null( SchemaPtr type ) {
  return TypedValue( std::move(type), ValueState::Null );
}

inline const kimport::TypedValue* kimport::TypedValue::find(
  const std::string& key ) const
{
  auto it = fields_.find( key );
  if ( it == fields_.end() ) return nullptr;
  return &it->second;
}

inline bool kimport::TypedValue::contains_state( ValueState s ) const {
  if ( state_ == s ) return true;
  for ( const auto& el : elements_ ) {
    if ( el.contains_state(s) ) return true;
  }
  for ( const auto& [key, field] : fields_ ) {
    if ( field.contains_state(s) ) return true;
  }
  return false;
}

inline kimport::ordered_node kimport::TypedValue::to_node() const {
  switch ( state_ ) {
    case ValueState::Null: return ordered_node();
    case ValueState::Pending: return internal::tagged_null(
      internal::UNKNOWN_TAG );
    case ValueState::Absent: return internal::tagged_null(
      internal::ABSENT_TAG );
    case ValueState::Known: break;
  }

  switch ( type_->shape() ) {
    case SchemaShape::Scalar: {
      if ( type_->scalar_kind() == ScalarKind::Dynamic ) return dynamic_;
      return std::visit( []( const auto& x ) {
        return internal::make_node_from( x );
      }, scalar_ );
    }
    case SchemaShape::List:
    case SchemaShape::Set: {
      std::vector< ordered_node > out;
      out.reserve( elements_.size() );
      for ( const auto& el : elements_ ) out.push_back( el.to_node() );
      if ( out.empty() ) return ordered_node::sequence();
      return internal::make_node_from( out );
    }
    case SchemaShape::Map:
    case SchemaShape::Object: {
      ordered_node out = ordered_node::mapping();
      for ( const auto& [key, field] : fields_ ) {
        out[ key ] = field.to_node();
      }
      return out;
    }
  }
  return ordered_node();
}

inline bool kimport::TypedValue::operator==( const TypedValue& o ) const {
  if ( state_ != o.state_ ) return false;
  if ( type_ != o.type_ && ( !type_ || !o.type_ || *type_ != *o.type_ ) ) {
    return false;
  }
  if ( state_ != ValueState::Known ) return true;
  if ( type_->shape() == SchemaShape::Scalar
    && type_->scalar_kind() == ScalarKind::Dynamic )
  {
    return ordered_node::serialize( dynamic_ )
      == ordered_node::serialize( o.dynamic_ );
  }
  return scalar_ == o.scalar_ && elements_ == o.elements_
    && fields_ == o.fields_;
}

// Identifier Parser

// The expected format for the import identifier is
//
//   "<apiGroup/><apiVersion>#<Kind>#<namespace>#<name>"
//
// where 'namespace' is only given for namespace-scoped resources, e.g.,
// "v1#Secret#default#default-token-qgm6s" or "apps/v1#Deployment#my-app".
inline kimport::ResourceIdentity kimport::parse_import_id(
  const std::string& id )
{
  const std::vector< std::string > parts
    = internal::split_on( id, internal::ID_SEPARATOR );
  if ( parts.size() < 3 || parts.size() > 4 ) {
    throw ParseError( "invalid format for import ID [" + id
      + "]: expected <group/version>#<Kind>#[<namespace>#]<name>" );
  }

  ResourceIdentity rid;
  rid.gvk = internal::gvk_from_api_version_and_kind( parts[0], parts[1] );
  if ( parts.size() == 4 ) {
    rid.ns = parts[ 2 ];
    rid.name = parts[ 3 ];
  }
  else {
    rid.name = parts[ 2 ];
  }
  return rid;
}

// Type Resolver

inline kimport::Resolution kimport::TypeResolver::resolve(
  const ResourceIdentity& id )
{
  Resolution res;
  std::optional< EndpointDescriptor > ep;
  std::optional< bool > namespaced;
  try {
    ep = registry_.lookup_endpoint( id.gvk );
    if ( ep ) namespaced = registry_.is_namespace_scoped( id.gvk );
  }
  catch ( const RemoteUnavailable& ex ) {
    throw ResolutionError( ErrorKind::RegistryUnreachable,
      "type registry unreachable while resolving " + id.gvk.to_string()
      + ": " + ex.what() );
  }

  if ( !ep || !namespaced ) {
    throw ResolutionError( ErrorKind::TypeUnknown,
      "no matches for kind \"" + id.gvk.kind + "\" in version \""
      + id.gvk.api_version() + "\"" );
  }
  res.endpoint = *ep;
  res.namespaced = *namespaced;

  // Scope disagreements are reported but left for the fetch to fail on
  if ( res.namespaced && !id.ns ) {
    res.scope_mismatch = id.gvk.to_string()
      + " is namespace scoped but the import ID has no namespace";
  }
  else if ( !res.namespaced && id.ns ) {
    res.scope_mismatch = id.gvk.to_string()
      + " is cluster scoped but the import ID names namespace '"
      + *id.ns + "'";
  }
  if ( res.scope_mismatch ) {
    spdlog::warn( "resolve: {}", *res.scope_mismatch );
  }

  spdlog::debug( "resolve: gvk={} endpoint={} namespaced={}",
    id.gvk.to_string(), res.endpoint.to_string(), res.namespaced );
  return res;
}

// Object Fetcher

inline kimport::ordered_node kimport::ObjectFetcher::fetch(
  const EndpointDescriptor& ep, const ResourceIdentity& id, bool namespaced,
  const CancelToken& cancel )
{
  cancel.check( "fetch " + id.to_string() );

  // Namespaced reads always carry a namespace, even an empty one
  const std::optional< std::string > ns = namespaced
    ? std::optional< std::string >( id.ns.value_or("") ) : std::nullopt;

  std::optional< ordered_node > obj;
  try {
    obj = store_.get( ep, ns, id.name, cancel );
  }
  catch ( const RemoteUnavailable& ex ) {
    throw FetchError( ErrorKind::Transport, ex.what() );
  }

  // A late cancellation wins over whatever the store returned
  cancel.check( "fetch " + id.to_string() );

  if ( !obj ) {
    std::string what = ep.resource + " \"" + id.name + "\" not found";
    if ( ns ) what += " in namespace \"" + *ns + "\"";
    throw FetchError( ErrorKind::NotFound, what );
  }
  if ( !obj->is_mapping() ) {
    throw FetchError( ErrorKind::Transport, "store returned a "
      + internal::raw_kind_name(*obj) + " instead of an object" );
  }
  return *obj;
}

// Server-Field Filter

inline kimport::ordered_node kimport::remove_server_side_fields(
  const ordered_node& obj )
{
  if ( !obj.is_mapping() ) return obj;

  const auto is_server_metadata = []( const std::string& k ) {
    for ( const auto& f : internal::SERVER_METADATA_FIELDS ) {
      if ( k == f ) return true;
    }
    return false;
  };

  ordered_node out = ordered_node::mapping();
  for ( const auto& [mk, mv] : obj.map_items() ) {
    const std::string k = internal::to_string_any( mk );
    if ( k == internal::STATUS ) continue;

    if ( k == internal::METADATA && mv.is_mapping() ) {
      ordered_node meta = ordered_node::mapping();
      for ( const auto& [ck, cv] : mv.map_items() ) {
        const std::string name = internal::to_string_any( ck );
        if ( is_server_metadata(name) ) continue;
        meta[ name ] = cv;
      }
      out[ k ] = meta;
      continue;
    }
    out[ k ] = mv;
  }
  return out;
}

// Schema Resolver

inline kimport::SchemaPtr kimport::SchemaCache::find(
  const GroupVersionKind& gvk ) const
{
  std::shared_lock< std::shared_mutex > lock( mutex_ );
  auto it = entries_.find( gvk );
  if ( it == entries_.end() ) return nullptr;
  return it->second;
}

inline kimport::SchemaPtr kimport::SchemaCache::insert(
  const GroupVersionKind& gvk, SchemaPtr schema )
{
  std::unique_lock< std::shared_mutex > lock( mutex_ );
  auto result = entries_.emplace( gvk, std::move(schema) );
  return result.first->second;
}

inline std::size_t kimport::SchemaCache::size() const {
  std::shared_lock< std::shared_mutex > lock( mutex_ );
  return entries_.size();
}

inline kimport::SchemaPtr kimport::SchemaResolver::schema_for(
  const ResourceIdentity& id )
{
  if ( SchemaPtr cached = cache_.find(id.gvk) ) {
    spdlog::debug( "schema: cache hit for {}", id.gvk.to_string() );
    return cached;
  }
  spdlog::debug( "schema: cache miss for {}", id.gvk.to_string() );

  SchemaPtr schema;
  try {
    schema = registry_.schema_for( id.gvk );
  }
  catch ( const RemoteUnavailable& ex ) {
    throw SchemaError( "schema registry unreachable for "
      + id.gvk.to_string() + ": " + ex.what() );
  }
  if ( !schema ) {
    throw SchemaError( "no schema definition for " + id.gvk.to_string() );
  }
  if ( schema->shape() != SchemaShape::Object ) {
    throw SchemaError( "schema for " + id.gvk.to_string()
      + " is not an object: " + schema->to_string() );
  }
  return cache_.insert( id.gvk, std::move(schema) );
}

// Typed Converter

namespace kimport::internal {

  // Run a child conversion, tagging any failure with its path step
  template < typename Fn >
  inline TypedValue convert_step( const std::string& step, Fn&& fn ) {
    try {
      return fn();
    }
    catch ( ConversionError& ex ) {
      ex.prepend( step );
      throw;
    }
  }

  inline TypedValue convert_scalar( const ordered_node& raw,
    const SchemaPtr& schema )
  {
    switch ( schema->scalar_kind() ) {
      case ScalarKind::String:
        if ( raw.is_string() ) {
          return TypedValue::scalar( schema,
            to_native_checked< std::string >(raw) );
        }
        // IntOrString values are kept as their decimal text
        if ( raw.is_integer() && schema->accepts_integer_as_string() ) {
          return TypedValue::scalar( schema,
            std::to_string(to_native_checked< std::int64_t >(raw)) );
        }
        break;
      case ScalarKind::Number:
        if ( raw.is_integer() ) {
          return TypedValue::scalar( schema,
            to_native_checked< std::int64_t >(raw) );
        }
        if ( raw.is_float_number() ) {
          return TypedValue::scalar( schema,
            to_native_checked< double >(raw) );
        }
        break;
      case ScalarKind::Bool:
        if ( raw.is_boolean() ) {
          return TypedValue::scalar( schema, raw.get_value< bool >() );
        }
        break;
      case ScalarKind::Dynamic:
        return TypedValue::dynamic( schema, raw );
    }
    throw_cannot_convert( raw, *schema );
  }

} // namespace kimport::internal

inline kimport::TypedValue kimport::to_typed_value( const ordered_node& raw,
  const SchemaPtr& schema )
{
  if ( !schema ) throw ConversionError( "no schema for value" );

  // Nothing to convert: the value is not determinable at this position
  if ( raw.is_null() ) return TypedValue::absent( schema );

  switch ( schema->shape() ) {
    case SchemaShape::Scalar:
      return internal::convert_scalar( raw, schema );

    case SchemaShape::Object: {
      if ( !raw.is_mapping() ) internal::throw_cannot_convert( raw, *schema );
      TypedValue::Fields fields;
      // The schema is authoritative: undeclared raw keys are never visited
      for ( const auto& [name, type] : schema->attributes() ) {
        if ( !raw.contains(name) ) {
          fields.emplace( name, TypedValue::absent(type) );
          continue;
        }
        const ordered_node& child = raw.at( name );
        fields.emplace( name, internal::convert_step( name, [&]() {
          return to_typed_value( child, type );
        }) );
      }
      return TypedValue::object( schema, std::move(fields) );
    }

    case SchemaShape::List:
    case SchemaShape::Set: {
      if ( !raw.is_sequence() ) internal::throw_cannot_convert( raw, *schema );
      TypedValue::Elements elements;
      elements.reserve( raw.size() );
      for ( size_t i = 0; i < raw.size(); ++i ) {
        const ordered_node& child = raw.at( i );
        elements.push_back( internal::convert_step( internal::seq_indexed(i),
          [&]() { return to_typed_value( child, schema->element() ); }) );
      }
      return TypedValue::sequence( schema, std::move(elements) );
    }

    case SchemaShape::Map: {
      if ( !raw.is_mapping() ) internal::throw_cannot_convert( raw, *schema );
      TypedValue::Fields entries;
      for ( const auto& [mk, mv] : raw.map_items() ) {
        const std::string key = internal::to_string_any( mk );
        entries.emplace( key, internal::convert_step(
          internal::key_indexed(key),
          [&]() { return to_typed_value( mv, schema->element() ); }) );
      }
      return TypedValue::map( schema, std::move(entries) );
    }
  }
  throw ConversionError( "unsupported schema shape" );
}

// Unknown Backfill Engine

inline kimport::TypedValue kimport::backfill_unknown( const SchemaPtr& schema,
  const TypedValue& value )
{
  switch ( value.state() ) {
    // The whole subtree is undetermined: one Pending marker, no recursion
    case ValueState::Absent: return TypedValue::pending( schema );
    case ValueState::Pending:
    case ValueState::Null: return value;
    case ValueState::Known: break;
  }

  switch ( schema->shape() ) {
    case SchemaShape::Scalar:
      return value;

    case SchemaShape::Object: {
      TypedValue::Fields fields;
      for ( const auto& [name, type] : schema->attributes() ) {
        const TypedValue* field = value.find( name );
        fields.emplace( name, field ? backfill_unknown( type, *field )
          : TypedValue::pending( type ) );
      }
      return TypedValue::object( schema, std::move(fields) );
    }

    case SchemaShape::List:
    case SchemaShape::Set: {
      TypedValue::Elements elements;
      elements.reserve( value.elements().size() );
      for ( const auto& el : value.elements() ) {
        TypedValue filled = backfill_unknown( schema->element(), el );
        if ( filled.is_pending() ) return TypedValue::pending( schema );
        elements.push_back( std::move(filled) );
      }
      return TypedValue::sequence( schema, std::move(elements) );
    }

    case SchemaShape::Map: {
      TypedValue::Fields entries;
      for ( const auto& [key, el] : value.fields() ) {
        TypedValue filled = backfill_unknown( schema->element(), el );
        if ( filled.is_pending() ) return TypedValue::pending( schema );
        entries.emplace( key, std::move(filled) );
      }
      return TypedValue::map( schema, std::move(entries) );
    }
  }
  return value;
}

inline kimport::TypedValue kimport::narrow_top_level( const TypedValue& value )
{
  if ( !value.is_known() || value.type()->shape() != SchemaShape::Object ) {
    return value;
  }

  const SchemaPtr& schema = value.type();
  TypedValue::Fields fields;
  for ( const auto& [name, field] : value.fields() ) {
    if ( field.is_pending() && schema->is_optional(name) ) {
      fields.emplace( name, TypedValue::null(field.type()) );
    }
    else {
      fields.emplace( name, field );
    }
  }
  return TypedValue::object( schema, std::move(fields) );
}

// Import Assembler

inline const kimport::ResourceType* kimport::find_resource_type(
  const std::string& type_name )
{
  static const ResourceType manifest = []() {
    const SchemaPtr str = FieldSchema::scalar( ScalarKind::String );
    const SchemaPtr wait_for = FieldSchema::object(
      { { internal::WAIT_FOR_FIELDS, FieldSchema::map(str) } },
      { internal::WAIT_FOR_FIELDS } );
    const SchemaPtr dyn = FieldSchema::scalar( ScalarKind::Dynamic );
    ResourceType rt;
    rt.name = internal::MANIFEST_RESOURCE_TYPE;
    rt.schema = FieldSchema::object( {
        { internal::MANIFEST, dyn },
        { internal::OBJECT, dyn },
        { internal::WAIT_FOR, wait_for }
      }, { internal::WAIT_FOR } );
    return rt;
  }();

  if ( type_name == manifest.name ) return &manifest;
  return nullptr;
}

inline kimport::ordered_node kimport::ImportedState::to_node() const {
  ordered_node out = ordered_node::mapping();
  out[ internal::MANIFEST ] = manifest.to_node();
  out[ internal::OBJECT ] = object.to_node();
  out[ internal::WAIT_FOR ] = wait_for.to_node();
  return out;
}

inline kimport::ImportedState kimport::assemble_imported_state(
  const ResourceType& rt, TypedValue object )
{
  if ( !rt.schema || rt.schema->shape() != SchemaShape::Object ) {
    throw AssemblyError( "resource type '" + rt.name + "' has no state schema" );
  }
  const auto& slots = rt.schema->attributes();
  auto wf = slots.find( internal::WAIT_FOR );
  if ( wf == slots.end() ) {
    throw AssemblyError( "resource type '" + rt.name
      + "' has no '" + internal::WAIT_FOR + "' slot" );
  }

  if ( !object.is_known() || object.type()->shape() != SchemaShape::Object ) {
    throw AssemblyError( "imported object is not a concrete object value" );
  }
  if ( object.contains_state(ValueState::Absent) ) {
    throw AssemblyError( "imported object still holds undetermined values" );
  }

  ImportedState state{
    TypedValue::object( FieldSchema::object({}), {} ),
    std::move( object ),
    TypedValue::null( wf->second )
  };
  return state;
}

// Importer

inline bool kimport::ImportResponse::has_errors() const {
  for ( const auto& d : diagnostics ) {
    if ( d.severity == Severity::Error ) return true;
  }
  return false;
}

inline kimport::ImportResponse kimport::Importer::import_resource(
  const std::string& type_name, const std::string& id,
  const CancelToken* cancel )
{
  ImportResponse resp;

  // Summary reported for a failure in the stage currently running
  std::string summary = "Failed to parse import ID";
  try {
    const ResourceIdentity rid = parse_import_id( id );
    spdlog::trace( "import: id={} gvk={} namespace={} name={}", id,
      rid.gvk.to_string(), rid.ns.value_or(""), rid.name );

    summary = "Failed to determine resource type";
    const ResourceType* rt = find_resource_type( type_name );
    if ( !rt ) {
      throw ResolutionError( ErrorKind::TypeUnknown,
        "unknown resource type '" + type_name + "'" );
    }

    summary = "Failed to get namespacing requirement from type registry";
    TypeResolver resolver( types_ );
    const Resolution res = resolver.resolve( rid );
    if ( res.scope_mismatch ) {
      resp.diagnostics.push_back( Diagnostic{ Severity::Warning,
        "Namespace scope does not match import ID", *res.scope_mismatch } );
    }

    summary = "Failed to get resource " + rid.to_string() + " from API";
    std::optional< CancelToken::clock::time_point > deadline;
    if ( options_.fetch_timeout.count() > 0 ) {
      deadline = CancelToken::clock::now() + options_.fetch_timeout;
    }
    CancelToken fetch_token( cancel, deadline );
    ObjectFetcher fetcher( store_ );
    const ordered_node live = fetcher.fetch( res.endpoint, rid,
      res.namespaced, fetch_token );
    spdlog::trace( "import: API resource\n{}", ordered_node::serialize(live) );

    summary = "Failed to determine resource type from GVK: "
      + rid.gvk.to_string();
    SchemaResolver schemas( schemas_, cache_ );
    const SchemaPtr schema = schemas.schema_for( rid );

    summary = "Failed to convert unstructured object to typed value";
    const ordered_node filtered = remove_server_side_fields( live );
    TypedValue value = to_typed_value( filtered, schema );

    summary = "Failed to backfill unknown values during import";
    value = backfill_unknown( schema, value );
    if ( options_.narrow_top_level ) value = narrow_top_level( value );
    spdlog::trace( "import: typed value\n{}",
      ordered_node::serialize(value.to_node()) );

    summary = "Failed to construct imported state";
    ImportedState state = assemble_imported_state( *rt, std::move(value) );
    ordered_node serialized = state.to_node();
    resp.imported.push_back( ImportedResource{ type_name, std::move(state),
      std::move(serialized) } );
  }
  catch ( const Canceled& ex ) {
    spdlog::error( "import: canceled: {}", ex.what() );
    resp.diagnostics.push_back( Diagnostic{ Severity::Error,
      "Import canceled", ex.what() } );
  }
  catch ( const ImportError& ex ) {
    spdlog::error( "import: {} ({}): {}", summary, to_string(ex.kind()),
      ex.what() );
    resp.diagnostics.push_back( Diagnostic{ Severity::Error, summary,
      ex.what() } );
  }
  return resp;
}
