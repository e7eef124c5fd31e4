#include "utils.hpp"

namespace asd::test {

    TEST_CASE("005: dot output uses ids by default", "[005][alps][dot]") {
        profile::alps_service service{};
        auto result = service.render(detail::blog_profile, false);
        REQUIRE(result.success);
        CHECK(result.error.empty());

        CHECK(result.document ==
              R"(digraph application_state_diagram {
  graph [labelloc="t",fontname="Helvetica",label="Blog"];
  node [shape=box,style="bold,filled",fillcolor="lightgray",fontname="Helvetica"];
  edge [fontname="Helvetica",fontsize=13];

  "Index" [label="Index"];
  "Article" [label="Article"];

  "Index" -> "Article" [label="goArticle (safe)",color="#00A86B"];
  "Article" -> "Index" [label="goIndex (safe)",color="#00A86B"];
  "Article" -> "Index" [label="doDelete (unsafe)",color="#FF4136"];
}
)");
    }

    TEST_CASE("005: dot output with titles", "[005][alps][dot]") {
        profile::alps_service service{};
        auto result = service.render(detail::blog_profile, true);
        REQUIRE(result.success);

        CHECK(result.document.find(R"("Index" [label="Home"];)") != std::string::npos);
        CHECK(result.document.find(R"("Article" [label="Article Page"];)") != std::string::npos);
        CHECK(result.document.find(R"([label="Open article (safe)",color="#00A86B"])") != std::string::npos);
        CHECK(result.document.find(R"([label="Delete article (unsafe)",color="#FF4136"])") != std::string::npos);
        // node ids stay stable whatever the labels are
        CHECK(result.document.find(R"("Index" -> "Article")") != std::string::npos);
    }

    TEST_CASE("005: idempotent edges, escaping and untitled profiles", "[005][alps][dot]") {
        auto parsed = profile::internal::parse_profile(R"({"alps":{"descriptor":[
            {"id":"Cart","title":"The \"cart\"","descriptor":[{"href":"#doUpdate"}]},
            {"id":"doUpdate","type":"idempotent","rt":"#Cart"}]}})");
        REQUIRE(parsed.model.has_value());

        auto plain = profile::internal::render_dot(*parsed.model, false);
        CHECK(plain.find(R"(graph [labelloc="t",fontname="Helvetica"];)") != std::string::npos);
        CHECK(plain.find(R"("Cart" -> "Cart" [label="doUpdate (idempotent)",color="#D4A000"];)") != std::string::npos);

        auto titled = profile::internal::render_dot(*parsed.model, true);
        CHECK(titled.find(R"("Cart" [label="The \"cart\""];)") != std::string::npos);
        // no title on the transition, the id is used
        CHECK(titled.find(R"([label="doUpdate (idempotent)")") != std::string::npos);
    }

    TEST_CASE("005: profile without transitions renders an empty graph", "[005][alps][dot]") {
        profile::alps_service service{};
        auto result = service.render(R"({"alps":{"descriptor":[{"id":"name"}]}})", false);
        REQUIRE(result.success);
        CHECK(result.document.find("->") == std::string::npos);
        CHECK(result.document.starts_with("digraph application_state_diagram {\n"));
        CHECK(result.document.ends_with("}\n"));
    }

    TEST_CASE("005: render reports parse failures", "[005][alps][dot]") {
        profile::alps_service service{};
        auto result = service.render(R"({"alps":{"descriptor":[{"id":"go","type":"safe"}]}})", true);
        CHECK_FALSE(result.success);
        CHECK(result.document.empty());
        CHECK(result.error == "Missing rt for safe transition: go");
    }

}  // namespace asd::test
