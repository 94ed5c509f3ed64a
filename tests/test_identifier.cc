#include <gtest/gtest.h>

#include "kimport.hh"

using kimport::parse_import_id;
using kimport::ParseError;

TEST( IdentifierParser, NamespacedSecret ) {
  const auto id = parse_import_id( "v1#Secret#default#default-token-qgm6s" );
  EXPECT_EQ( id.gvk.group, "" );
  EXPECT_EQ( id.gvk.version, "v1" );
  EXPECT_EQ( id.gvk.kind, "Secret" );
  ASSERT_TRUE( id.ns.has_value() );
  EXPECT_EQ( *id.ns, "default" );
  EXPECT_EQ( id.name, "default-token-qgm6s" );
}

TEST( IdentifierParser, ClusterScopedDeployment ) {
  const auto id = parse_import_id( "apps/v1#Deployment#my-app" );
  EXPECT_EQ( id.gvk.group, "apps" );
  EXPECT_EQ( id.gvk.version, "v1" );
  EXPECT_EQ( id.gvk.kind, "Deployment" );
  EXPECT_FALSE( id.ns.has_value() );
  EXPECT_EQ( id.name, "my-app" );
}

TEST( IdentifierParser, SegmentPositions ) {
  const auto three = parse_import_id( "rbac.authorization.k8s.io/v1"
    "#ClusterRole#view" );
  EXPECT_FALSE( three.ns.has_value() );
  EXPECT_EQ( three.name, "view" );
  EXPECT_EQ( three.gvk.group, "rbac.authorization.k8s.io" );

  const auto four = parse_import_id( "batch/v1#Job#ci#nightly" );
  ASSERT_TRUE( four.ns.has_value() );
  EXPECT_EQ( *four.ns, "ci" );
  EXPECT_EQ( four.name, "nightly" );
}

TEST( IdentifierParser, RejectsWrongSegmentCount ) {
  for ( const std::string bad : { "", "v1", "v1#Secret", "a#b#c#d#e",
    "v1#Secret#ns#name#extra#more" } )
  {
    EXPECT_THROW( parse_import_id(bad), ParseError ) << bad;
  }
}

TEST( IdentifierParser, ErrorNamesTheIdentifier ) {
  try {
    parse_import_id( "v1#Secret" );
    FAIL() << "expected ParseError";
  }
  catch ( const ParseError& ex ) {
    EXPECT_NE( std::string( ex.what() ).find("[v1#Secret]"),
      std::string::npos );
    EXPECT_EQ( ex.kind(), kimport::ErrorKind::Parse );
  }
}

TEST( IdentifierParser, DoesNotValidateSegmentContents ) {
  // Empty namespace and name are left for the resolver and fetcher
  const auto id = parse_import_id( "v1#ConfigMap##" );
  ASSERT_TRUE( id.ns.has_value() );
  EXPECT_EQ( *id.ns, "" );
  EXPECT_EQ( id.name, "" );

  const auto odd = parse_import_id( "v1#Secret#Not_A_Valid Name!" );
  EXPECT_EQ( odd.name, "Not_A_Valid Name!" );
}

TEST( IdentifierParser, MalformedGroupVersionYieldsEmptyGroupVersion ) {
  const auto id = parse_import_id( "a/b/c#Widget#w" );
  EXPECT_EQ( id.gvk.group, "" );
  EXPECT_EQ( id.gvk.version, "" );
  EXPECT_EQ( id.gvk.kind, "Widget" );
}

TEST( IdentifierParser, ApiVersionRoundTrip ) {
  EXPECT_EQ( parse_import_id("apps/v1#Deployment#x").gvk.api_version(),
    "apps/v1" );
  EXPECT_EQ( parse_import_id("v1#Pod#ns#x").gvk.api_version(), "v1" );
  EXPECT_EQ( parse_import_id("apps/v1#Deployment#x").gvk.to_string(),
    "apps/v1, Kind=Deployment" );
}
