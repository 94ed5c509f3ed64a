#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include "kimport.hh"
#include "kimport_catalog.hh"

namespace kimport::fixtures {

  inline ordered_node yaml( const std::string& text ) {
    return ordered_node::deserialize( text );
  }

  inline SchemaPtr schema( const std::string& text ) {
    return schema_from_node( yaml(text) );
  }

  // The catalog shipped under samples/, shared with the command line tool
  inline Catalog sample_catalog() {
    std::ifstream in( KIMPORT_SAMPLE_CATALOG );
    if ( !in ) {
      throw std::runtime_error( "cannot open " KIMPORT_SAMPLE_CATALOG );
    }
    return Catalog::load( in );
  }

  inline std::string str( const TypedValue& v ) {
    return std::get< std::string >( v.scalar_value() );
  }

  inline std::int64_t integer( const TypedValue& v ) {
    return std::get< std::int64_t >( v.scalar_value() );
  }

  // Walk object attributes by name, e.g., at(v, {"spec", "replicas"})
  inline const TypedValue& at( const TypedValue& v,
    std::initializer_list< std::string > names )
  {
    const TypedValue* cur = &v;
    for ( const auto& n : names ) {
      cur = cur->find( n );
      if ( !cur ) throw std::out_of_range( "no attribute '" + n + "'" );
    }
    return *cur;
  }

} // namespace kimport::fixtures
