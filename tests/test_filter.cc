#include <gtest/gtest.h>

#include "fixtures.hh"

using kimport::ordered_node;
using kimport::remove_server_side_fields;
using kimport::fixtures::yaml;

namespace {

const char* LIVE_POD = R"(
apiVersion: v1
kind: Pod
metadata:
  name: web-0
  namespace: default
  uid: 1b2c3d4e
  resourceVersion: "812"
  generation: 2
  selfLink: /api/v1/namespaces/default/pods/web-0
  creationTimestamp: "2024-05-01T10:00:00Z"
  managedFields:
    - manager: kubectl
      operation: Apply
  labels:
    app: web
spec:
  containers:
    - name: web
      image: nginx
  status: not-a-real-status
status:
  phase: Running
)";

} // namespace

TEST( ServerFieldFilter, RemovesStatusAndServerMetadata ) {
  const ordered_node out = remove_server_side_fields( yaml(LIVE_POD) );

  EXPECT_FALSE( out.contains("status") );
  const ordered_node& meta = out.at( "metadata" );
  for ( const char* f : { "uid", "resourceVersion", "generation", "selfLink",
    "creationTimestamp", "managedFields" } )
  {
    EXPECT_FALSE( meta.contains(f) ) << f;
  }
}

TEST( ServerFieldFilter, KeepsOperatorFields ) {
  const ordered_node out = remove_server_side_fields( yaml(LIVE_POD) );

  EXPECT_EQ( out.at("apiVersion").get_value< std::string >(), "v1" );
  EXPECT_EQ( out.at("kind").get_value< std::string >(), "Pod" );
  const ordered_node& meta = out.at( "metadata" );
  EXPECT_EQ( meta.at("name").get_value< std::string >(), "web-0" );
  EXPECT_EQ( meta.at("namespace").get_value< std::string >(), "default" );
  EXPECT_EQ( meta.at("labels").at("app").get_value< std::string >(), "web" );
}

TEST( ServerFieldFilter, NeverTouchesSpec ) {
  const ordered_node in = yaml( LIVE_POD );
  const ordered_node out = remove_server_side_fields( in );
  EXPECT_EQ( ordered_node::serialize(out.at("spec")),
    ordered_node::serialize(in.at("spec")) );
  EXPECT_TRUE( out.at("spec").contains("status") );
}

TEST( ServerFieldFilter, ToleratesMissingFields ) {
  const ordered_node in = yaml( "apiVersion: v1\nkind: ConfigMap\n"
    "data:\n  a: b\n" );
  const ordered_node out = remove_server_side_fields( in );
  EXPECT_FALSE( out.contains("metadata") );
  EXPECT_FALSE( out.contains("status") );
  EXPECT_EQ( out.at("data").at("a").get_value< std::string >(), "b" );
  EXPECT_EQ( out.size(), in.size() );
}

TEST( ServerFieldFilter, LeavesNonMappingMetadataAlone ) {
  const ordered_node out = remove_server_side_fields(
    yaml("metadata: [uid, resourceVersion]\nstatus: {}\n") );
  EXPECT_FALSE( out.contains("status") );
  ASSERT_TRUE( out.at("metadata").is_sequence() );
  EXPECT_EQ( out.at("metadata").size(), 2u );
}
