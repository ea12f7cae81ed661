// Copyright 2025 Oleg Maximenko
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "gdl/loader.h"

#include <gtest/gtest.h>

#include "common/test_helpers.h"

using namespace gdl;
using model::EntityKind;
using model::PropertyValue;
using test::ThrowsError;

namespace {

VertexDeclaration V(std::optional<std::string> variable = std::nullopt,
                    std::optional<std::string> label = std::nullopt,
                    model::Properties properties = {}) {
  VertexDeclaration vertex;
  vertex.variable = std::move(variable);
  vertex.label = std::move(label);
  vertex.properties = std::move(properties);
  return vertex;
}

EdgeDeclaration E(std::optional<std::string> variable = std::nullopt,
                  EdgeDirection direction = EdgeDirection::Outgoing) {
  EdgeDeclaration edge;
  edge.variable = std::move(variable);
  edge.direction = direction;
  return edge;
}

GraphStart G(std::optional<std::string> variable = std::nullopt,
             std::optional<uint64_t> id = std::nullopt) {
  GraphStart graph;
  graph.variable = std::move(variable);
  graph.id = id;
  return graph;
}

model::Predicate AgeGreaterThan(const std::string& variable, int64_t age) {
  return model::MakeComparison(model::PropertyReference{variable, "age"},
                               model::CompOp::GreaterThan,
                               model::Literal{PropertyValue(age)});
}

}  // namespace

TEST(Loader, Empty) {
  Loader loader;
  EXPECT_TRUE(loader.graphs().empty());
  EXPECT_TRUE(loader.vertices().empty());
  EXPECT_TRUE(loader.edges().empty());
  EXPECT_FALSE(loader.predicates());
  EXPECT_TRUE(loader.vertexCache(true, true).empty());
}

TEST(Loader, Path) {
  Loader loader;
  loader.Process(Events{V("a"), E("e"), V("b"), E(), V("c"), PathEnd{}});

  auto& vertices = loader.vertices();
  ASSERT_EQ(vertices.size(), 3u);
  EXPECT_EQ(vertices[0].id, 0u);
  EXPECT_EQ(vertices[0].label, "__VERTEX");

  auto& edges = loader.edges();
  ASSERT_EQ(edges.size(), 2u);
  EXPECT_EQ(edges[0].label, "__EDGE");
  EXPECT_EQ(edges[0].sourceVertexId, 0u);
  EXPECT_EQ(edges[0].targetVertexId, 1u);
  EXPECT_EQ(edges[1].sourceVertexId, 1u);
  EXPECT_EQ(edges[1].targetVertexId, 2u);
  EXPECT_FALSE(edges[0].length);
}

TEST(Loader, IncomingEdge) {
  Loader loader;
  loader.Process(Events{V("a"), E("e", EdgeDirection::Incoming), V("b"),
                        PathEnd{}});
  auto& edge = loader.edges().at(0);
  EXPECT_EQ(edge.sourceVertexId, 1u);
  EXPECT_EQ(edge.targetVertexId, 0u);
}

TEST(Loader, VariablesAreReused) {
  Loader loader;
  loader.Process(Events{V("a"), E(), V("b"), PathEnd{}, V("a"), E(), V("c"),
                        PathEnd{}});
  EXPECT_EQ(loader.vertices().size(), 3u);
  ASSERT_EQ(loader.edges().size(), 2u);
  EXPECT_EQ(loader.edges()[1].sourceVertexId, 0u);
  EXPECT_EQ(loader.edges()[1].targetVertexId, 2u);
}

TEST(Loader, AnonymousElementsAreDistinct) {
  Loader loader;
  loader.Process(Events{V(), PathEnd{}, V(), PathEnd{}});
  ASSERT_EQ(loader.vertices().size(), 2u);
  EXPECT_NE(loader.vertices()[0].id, loader.vertices()[1].id);
}

TEST(Loader, Labels) {
  Loader loader;
  loader.Process(Events{V("a"), PathEnd{}, V("a", "Person"), PathEnd{},
                        V("b", "City"), PathEnd{}, V("b"), PathEnd{}});
  EXPECT_EQ(loader.vertices()[0].label, "Person");
  EXPECT_EQ(loader.vertices()[1].label, "City");

  EXPECT_TRUE(ThrowsError([&] { loader.Process(V("a", "Company")); },
                          ErrorCode::E0202));
}

TEST(Loader, DefaultLabelsDisabled) {
  LoaderOptions options;
  options.useDefaultVertexLabel = false;
  options.defaultEdgeLabel = "RELATED";
  Loader loader(options);
  loader.Process(Events{V("a"), E(), V("b", "Person"), PathEnd{}});

  EXPECT_FALSE(loader.vertices()[0].label);
  EXPECT_EQ(loader.vertices()[1].label, "Person");
  EXPECT_EQ(loader.edges()[0].label, "RELATED");
}

TEST(Loader, Properties) {
  Loader loader;
  loader.Process(Events{
      V("a", std::nullopt, {{"name", PropertyValue(std::string("Alice"))}}),
      PathEnd{},
      V("a", std::nullopt, {{"age", PropertyValue(int64_t{42})}}),
      PathEnd{},
      V("a", std::nullopt, {{"age", PropertyValue(int64_t{42})}}),
      PathEnd{},
  });

  auto& properties = loader.vertices().at(0).properties;
  ASSERT_EQ(properties.size(), 2u);
  EXPECT_EQ(properties.at("name"), PropertyValue(std::string("Alice")));
  EXPECT_EQ(properties.at("age"), PropertyValue(int64_t{42}));

  EXPECT_TRUE(ThrowsError(
      [&] {
        loader.Process(
            V("a", std::nullopt, {{"age", PropertyValue(int64_t{43})}}));
      },
      ErrorCode::E0203));
}

TEST(Loader, PropertyAndLabelEvents) {
  Loader loader;
  loader.Process(Events{
      V("a"),
      PathEnd{},
      PropertyAssignment{EntityKind::Vertex, "a", "age",
                         PropertyValue(int64_t{42}), {}},
      LabelDeclaration{EntityKind::Vertex, "a", "Person", {}},
  });
  EXPECT_EQ(loader.vertices()[0].label, "Person");
  EXPECT_EQ(loader.vertices()[0].properties.at("age"),
            PropertyValue(int64_t{42}));

  EXPECT_TRUE(ThrowsError(
      [&] {
        loader.Process(LabelDeclaration{EntityKind::Vertex, "x", "L", {}});
      },
      ErrorCode::E0207));
  EXPECT_TRUE(ThrowsError(
      [&] {
        loader.Process(LabelDeclaration{EntityKind::Edge, "a", "L", {}});
      },
      ErrorCode::E0201));
}

TEST(Loader, VariableKindConflict) {
  Loader loader;
  loader.Process(Events{V("a"), PathEnd{}});
  EXPECT_TRUE(ThrowsError(
      [&] { loader.Process(Events{V("b"), E("a"), V("c")}); },
      ErrorCode::E0201));
}

TEST(Loader, NestedGraphs) {
  Loader loader;
  loader.Process(Events{G("outer"), G("inner"), V("a"), E("e"), V("b"),
                        PathEnd{}, GraphEnd{}, V("c"), PathEnd{}, GraphEnd{},
                        V("d"), PathEnd{}});

  auto& graphs = loader.graphs();
  ASSERT_EQ(graphs.size(), 2u);
  EXPECT_EQ(graphs[0].label, "__GRAPH");
  EXPECT_EQ(graphs[0].vertexIds, (std::set<uint64_t>{0, 1, 2}));
  EXPECT_EQ(graphs[0].edgeIds, (std::set<uint64_t>{0}));
  EXPECT_EQ(graphs[1].vertexIds, (std::set<uint64_t>{0, 1}));
  EXPECT_EQ(graphs[1].edgeIds, (std::set<uint64_t>{0}));
  EXPECT_EQ(loader.vertices().size(), 4u);
}

TEST(Loader, GraphReopened) {
  Loader loader;
  loader.Process(Events{G("g"), V("a"), PathEnd{}, GraphEnd{}, G("g"), V("b"),
                        PathEnd{}, GraphEnd{}});
  ASSERT_EQ(loader.graphs().size(), 1u);
  EXPECT_EQ(loader.graphs()[0].vertexIds, (std::set<uint64_t>{0, 1}));
}

TEST(Loader, UnbalancedGraphEnd) {
  Loader loader;
  EXPECT_TRUE(
      ThrowsError([&] { loader.Process(GraphEnd{}); }, ErrorCode::E0206));
}

TEST(Loader, LiteralGraphIds) {
  Loader loader;
  loader.Process(Events{G("g", 1), GraphEnd{}, G(), GraphEnd{}, G(),
                        GraphEnd{}});
  auto& graphs = loader.graphs();
  ASSERT_EQ(graphs.size(), 3u);
  EXPECT_EQ(graphs[0].id, 1u);
  EXPECT_EQ(graphs[1].id, 0u);
  EXPECT_EQ(graphs[2].id, 2u);

  EXPECT_TRUE(
      ThrowsError([&] { loader.Process(G("h", 2)); }, ErrorCode::E0205));
}

TEST(Loader, CustomIdGenerator) {
  LoaderOptions options;
  options.nextVertexId = [next = uint64_t{100}]() mutable {
    auto id = next;
    next += 100;
    return id;
  };
  Loader loader(options);
  loader.Process(Events{V(), E(), V(), PathEnd{}});

  EXPECT_EQ(loader.vertices()[0].id, 100u);
  EXPECT_EQ(loader.vertices()[1].id, 200u);
  EXPECT_EQ(loader.edges()[0].sourceVertexId, 100u);
  EXPECT_EQ(loader.edges()[0].targetVertexId, 200u);
}

TEST(Loader, InvalidOptions) {
  LoaderOptions emptyLabel;
  emptyLabel.defaultEdgeLabel = "";
  EXPECT_TRUE(ThrowsError([&] { Loader loader(emptyLabel); },
                          ErrorCode::E0002));

  LoaderOptions noGenerator;
  noGenerator.nextGraphId = nullptr;
  EXPECT_TRUE(ThrowsError([&] { Loader loader(noGenerator); },
                          ErrorCode::E0003));
}

TEST(Loader, ExplicitEndpoints) {
  Loader loader;
  auto edge = E("e");
  edge.source = "y";
  edge.target = "x";
  loader.Process(Events{edge, PathEnd{}});

  auto error = test::CatchError([&] { loader.edges(); });
  ASSERT_TRUE(error);
  EXPECT_EQ(error->kind(), ErrorKind::DanglingReference);
  EXPECT_EQ(error->errorCode(), ErrorCode::E0301);
  EXPECT_NE(error->message().find("\"x\""), std::string::npos);
  EXPECT_TRUE(ThrowsError([&] { loader.predicates(); }, ErrorCode::E0301));
  EXPECT_TRUE(ThrowsError([&] { loader.vertexCache(); }, ErrorCode::E0301));

  loader.Process(Events{V("y"), PathEnd{}, V("x"), PathEnd{}});
  auto& resolved = loader.edges().at(0);
  EXPECT_EQ(resolved.sourceVertexId, 0u);
  EXPECT_EQ(resolved.targetVertexId, 1u);
}

TEST(Loader, PendingEndpointNameIsAVertexVariable) {
  Loader loader;
  auto edge = E("e");
  edge.source = "x";
  edge.target = "x";
  loader.Process(Events{edge, PathEnd{}});
  EXPECT_TRUE(ThrowsError([&] { loader.Process(G("x")); }, ErrorCode::E0201));
}

TEST(Loader, EdgeWithoutVertices) {
  {
    Loader loader;
    EXPECT_TRUE(ThrowsError([&] { loader.Process(E("e")); }, ErrorCode::E0303));
  }
  {
    Loader loader;
    loader.Process(Events{V("a"), E("e")});
    EXPECT_TRUE(ThrowsError([&] { loader.vertices(); }, ErrorCode::E0302));
    EXPECT_TRUE(
        ThrowsError([&] { loader.Process(PathEnd{}); }, ErrorCode::E0302));
  }
}

TEST(Loader, EdgeReReferenced) {
  Loader loader;
  loader.Process(Events{V("a"), E("e"), V("b"), PathEnd{}, V("a"), E("e"),
                        V("b"), PathEnd{}});
  EXPECT_EQ(loader.edges().size(), 1u);

  EXPECT_TRUE(ThrowsError(
      [&] { loader.Process(Events{V("c"), E("e"), V("b"), PathEnd{}}); },
      ErrorCode::E0204));
}

TEST(Loader, EdgeTargetChanged) {
  Loader loader;
  loader.Process(Events{V("a"), E("e"), V("b"), PathEnd{}, V("a"), E("e")});
  EXPECT_TRUE(
      ThrowsError([&] { loader.Process(V("c")); }, ErrorCode::E0204));
}

TEST(Loader, EdgeLength) {
  Loader loader;
  auto first = E("e");
  first.length = model::EdgeLength{1, 3};
  loader.Process(Events{V("a"), first, V("b"), PathEnd{}});
  EXPECT_EQ(loader.edges()[0].length, (model::EdgeLength{1, 3}));

  auto second = E("e");
  second.length = model::EdgeLength{2, 2};
  EXPECT_TRUE(ThrowsError([&] { loader.Process(Events{V("a"), second}); },
                          ErrorCode::E0208));
}

TEST(Loader, Predicates) {
  Loader loader;
  loader.Process(PredicateExpression{AgeGreaterThan("a", 10), {}});
  EXPECT_EQ(ToString(*loader.predicates()), "a.age > 10");

  loader.Process(PredicateExpression{
      model::MakeOr(
          {AgeGreaterThan("b", 20),
           model::MakeAnd({AgeGreaterThan("c", 30), AgeGreaterThan("d", 40)})}),
      {}});
  EXPECT_EQ(ToString(*loader.predicates()),
            "a.age > 10 AND (b.age > 20 OR c.age > 30) AND "
            "(b.age > 20 OR d.age > 40)");
  EXPECT_EQ(model::ToCnf(*loader.predicates()), *loader.predicates());
}

TEST(Loader, Query) {
  Loader loader;
  loader.Process(Events{
      QueryStart{},
      V("a", "Person", {{"name", PropertyValue(std::string("Alice"))}}),
      E(),
      V(std::nullopt, std::nullopt, {{"age", PropertyValue(int64_t{23})}}),
      PathEnd{},
      PredicateExpression{AgeGreaterThan("a", 18), {}},
      QueryEnd{},
  });

  ASSERT_EQ(loader.vertices().size(), 2u);
  EXPECT_EQ(loader.vertices()[0].label, "Person");
  EXPECT_TRUE(loader.vertices()[0].properties.empty());
  EXPECT_TRUE(loader.vertices()[1].properties.empty());
  EXPECT_EQ(ToString(*loader.predicates()),
            "a.name = \"Alice\" AND __v0.age = 23 AND a.age > 18");
}

TEST(Loader, MisplacedQuery) {
  {
    Loader loader;
    loader.Process(QueryStart{});
    EXPECT_TRUE(
        ThrowsError([&] { loader.Process(QueryStart{}); }, ErrorCode::E0209));
  }
  {
    Loader loader;
    loader.Process(QueryStart{});
    EXPECT_TRUE(
        ThrowsError([&] { loader.Process(G("g")); }, ErrorCode::E0209));
  }
  {
    Loader loader;
    loader.Process(G("g"));
    EXPECT_TRUE(
        ThrowsError([&] { loader.Process(QueryStart{}); }, ErrorCode::E0209));
  }
  {
    Loader loader;
    EXPECT_TRUE(
        ThrowsError([&] { loader.Process(QueryEnd{}); }, ErrorCode::E0209));
  }
}

TEST(Loader, Caches) {
  Loader loader;
  loader.Process(Events{G("g"), V("a"), E(), V(), E("e"), V("a"), PathEnd{},
                        GraphEnd{}});

  auto user = loader.vertexCache();
  auto generated = loader.vertexCache(false, true);
  auto all = loader.vertexCache(true, true);
  ASSERT_EQ(user.size(), 1u);
  EXPECT_EQ(user.at("a").id, 0u);
  ASSERT_EQ(generated.size(), 1u);
  EXPECT_EQ(generated.at("__v0").id, 1u);
  EXPECT_EQ(all.size(), user.size() + generated.size());
  for (auto& [name, vertex] : user) {
    EXPECT_EQ(all.at(name).id, vertex.id);
  }
  EXPECT_TRUE(loader.vertexCache(false, false).empty());

  EXPECT_EQ(loader.edgeCache().size(), 1u);
  EXPECT_EQ(loader.edgeCache(false, true).count("__e0"), 1u);
  EXPECT_EQ(loader.graphCache().at("g").vertexIds,
            (std::set<uint64_t>{0, 1}));
}

TEST(Loader, LogsCreation) {
  test::LogCapture capture;
  Loader loader;
  loader.Process(Events{V("a", "Person"), PathEnd{}});
  EXPECT_TRUE(capture.Contains(log::Level::Debug,
                               "Created vertex 0 \"a\" with label \"Person\""));
}
