#include <gtest/gtest.h>

#include "fixtures.hh"

using namespace kimport;
using kimport::fixtures::at;
using kimport::fixtures::schema;
using kimport::fixtures::yaml;

namespace {

const char* APP_SCHEMA = R"(
object:
  apiVersion: string
  kind: string
  metadata:
    object:
      name: string
      labels: { map: string }
      annotations: { map: string }
    optional: [labels, annotations]
  spec:
    object:
      replicas: number
      args: { list: string }
      selector:
        object:
          matchLabels: { map: string }
        optional: [matchLabels]
      volumes:
        list:
          object:
            name: string
            size: number
          optional: [size]
    optional: [replicas, args, selector, volumes]
  status:
    object:
      ready: bool
  immutable: bool
optional: [spec, status, immutable]
)";

TypedValue convert_and_backfill( const std::string& raw_text ) {
  const SchemaPtr s = schema( APP_SCHEMA );
  return backfill_unknown( s, to_typed_value(yaml(raw_text), s) );
}

// No descendant of a Pending node may hold a concrete value
void expect_pending_roots_are_empty( const TypedValue& v ) {
  if ( v.is_pending() ) {
    EXPECT_TRUE( v.elements().empty() );
    EXPECT_TRUE( v.fields().empty() );
    return;
  }
  for ( const auto& el : v.elements() ) expect_pending_roots_are_empty( el );
  for ( const auto& [k, f] : v.fields() ) expect_pending_roots_are_empty( f );
}

} // namespace

TEST( UnknownBackfill, AbsentSubtreesBecomeSinglePendingMarkers ) {
  const TypedValue v = convert_and_backfill( R"(
apiVersion: example.com/v1
kind: App
metadata:
  name: demo
spec:
  replicas: 2
)" );

  EXPECT_FALSE( v.contains_state(ValueState::Absent) );

  const TypedValue& labels = at( v, {"metadata", "labels"} );
  EXPECT_TRUE( labels.is_pending() );
  EXPECT_EQ( labels.type()->shape(), SchemaShape::Map );

  const TypedValue& selector = at( v, {"spec", "selector"} );
  EXPECT_TRUE( selector.is_pending() );
  EXPECT_EQ( selector.type()->shape(), SchemaShape::Object );
  EXPECT_TRUE( selector.fields().empty() );

  EXPECT_TRUE( at(v, {"spec", "volumes"}).is_pending() );
  EXPECT_TRUE( at(v, {"status"}).is_pending() );
  EXPECT_TRUE( at(v, {"spec", "replicas"}).is_known() );

  expect_pending_roots_are_empty( v );
}

TEST( UnknownBackfill, FullyKnownTreeIsUnchanged ) {
  const SchemaPtr s = schema( APP_SCHEMA );
  const TypedValue converted = to_typed_value( yaml(R"(
apiVersion: example.com/v1
kind: App
metadata:
  name: demo
  labels: { app: demo }
  annotations: {}
spec:
  replicas: 1
  args: [serve]
  selector:
    matchLabels: { app: demo }
  volumes:
    - name: data
      size: 10
status:
  ready: true
immutable: false
)"), s );
  ASSERT_FALSE( converted.contains_state(ValueState::Absent) );

  const TypedValue filled = backfill_unknown( s, converted );
  EXPECT_TRUE( filled == converted );
  EXPECT_TRUE( narrow_top_level(filled) == converted );
}

TEST( UnknownBackfill, BackfillIsIdempotent ) {
  const SchemaPtr s = schema( APP_SCHEMA );
  const TypedValue once = backfill_unknown( s,
    to_typed_value(yaml("kind: App\nspec: { args: [a] }\n"), s) );
  EXPECT_TRUE( backfill_unknown(s, once) == once );
}

TEST( UnknownBackfill, CollectionsAreNeverPartiallyPending ) {
  const TypedValue v = convert_and_backfill( R"(
kind: App
spec:
  args: [serve, ~, verbose]
  volumes:
    - name: data
    - name: logs
      size: 5
metadata:
  name: demo
  labels:
    app: demo
    tier: ~
)" );

  // A null element makes the whole list (or map) Pending
  const TypedValue& args = at( v, {"spec", "args"} );
  EXPECT_TRUE( args.is_pending() );
  EXPECT_TRUE( args.elements().empty() );
  EXPECT_TRUE( at(v, {"metadata", "labels"}).is_pending() );

  // Object elements stay concrete; their missing attributes are Pending
  const TypedValue& volumes = at( v, {"spec", "volumes"} );
  EXPECT_TRUE( volumes.is_known() );
  ASSERT_EQ( volumes.elements().size(), 2u );
  EXPECT_TRUE( volumes.elements()[0].find("size")->is_pending() );

  expect_pending_roots_are_empty( v );
}

TEST( UnknownBackfill, TopLevelOptionalPendingNarrowsToNull ) {
  const TypedValue v = narrow_top_level( convert_and_backfill(R"(
apiVersion: example.com/v1
kind: App
metadata:
  name: demo
spec:
  replicas: 2
)") );

  // Top level, optional: explicit Null
  EXPECT_TRUE( at(v, {"status"}).is_null() );
  EXPECT_TRUE( at(v, {"immutable"}).is_null() );
  EXPECT_EQ( at(v, {"immutable"}).type()->scalar_kind(), ScalarKind::Bool );

  // Nested, optional: stays Pending
  EXPECT_TRUE( at(v, {"metadata", "labels"}).is_pending() );
  EXPECT_TRUE( at(v, {"spec", "args"}).is_pending() );

  // Concrete attributes are untouched
  EXPECT_TRUE( at(v, {"spec", "replicas"}).is_known() );
}

TEST( UnknownBackfill, TopLevelRequiredPendingIsKept ) {
  const TypedValue v = narrow_top_level(
    convert_and_backfill("metadata: { name: demo }\n") );
  EXPECT_TRUE( at(v, {"apiVersion"}).is_pending() );
  EXPECT_TRUE( at(v, {"kind"}).is_pending() );
  EXPECT_TRUE( at(v, {"spec"}).is_null() );
}

TEST( UnknownBackfill, NarrowingLeavesNonObjectsAlone ) {
  const SchemaPtr s = schema( "{ list: string }" );
  const TypedValue pending = TypedValue::pending( s );
  EXPECT_TRUE( narrow_top_level(pending).is_pending() );
}

TEST( UnknownBackfill, SerializedMarkersAreTagged ) {
  const TypedValue v = narrow_top_level( convert_and_backfill(
    "kind: App\nmetadata: { name: demo }\n") );
  const ordered_node flat = v.to_node();

  const ordered_node& labels = flat.at( "metadata" ).at( "labels" );
  EXPECT_TRUE( labels.is_null() );
  ASSERT_TRUE( labels.has_tag_name() );
  EXPECT_EQ( labels.get_tag_name(), internal::UNKNOWN_TAG );

  EXPECT_TRUE( flat.at("status").is_null() );
  EXPECT_FALSE( flat.at("status").has_tag_name() );
  EXPECT_EQ( flat.at("kind").get_value< std::string >(), "App" );
}
