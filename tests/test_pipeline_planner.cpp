#include <gtest/gtest.h>

#include "fixture_plugins.hpp"
#include "kernel/address.hpp"
#include "kernel/services/pipeline_planner.hpp"

using nf::Mode;
using nf::parse_address;
using nf_test::ResolverFixture;

namespace {

std::vector<std::string> names_of(const std::vector<nf::PlannedStage>& plan) {
  std::vector<std::string> out;
  for (const auto& s : plan) out.push_back(s.plugin_name);
  return out;
}

std::vector<std::string> modes_of(const std::vector<nf::PlannedStage>& plan) {
  std::vector<std::string> out;
  for (const auto& s : plan) out.push_back(nf::mode_name(s.mode));
  return out;
}

using Strings = std::vector<std::string>;

}  // namespace

TEST(ConfigValue, RendersForTheCommandLine) {
  EXPECT_EQ(nf::config_value_to_string(true), "true");
  EXPECT_EQ(nf::config_value_to_string(std::int64_t{-3}), "-3");
  EXPECT_EQ(nf::config_value_to_string(0.25), "0.25");
  EXPECT_EQ(nf::config_value_to_string(2.0), "2.0");
  EXPECT_EQ(nf::config_value_to_string(std::string("a b")), "a b");
}

TEST(PipelinePlanner, LocalFileIsOneStageReadingTheFile) {
  ResolverFixture f;
  nf::PipelinePlanner planner(f.resolver);
  auto address = parse_address("data.txt~csv?delimiter=;");
  auto plan = planner.plan(address, Mode::Read);
  ASSERT_EQ(names_of(plan), Strings{"csv_"});

  auto argv = nf::build_argv(plan[0], {});
  EXPECT_EQ(argv, (Strings{"/opt/ndflow/plugins/formats/csv_.py", "--mode", "read", "--delimiter", ";"}));

  auto stages = nf::make_read_stages(address, plan, {});
  ASSERT_EQ(stages.size(), 1u);
  EXPECT_EQ(stages[0].role, nf::StageRole::Source);
  EXPECT_EQ(stages[0].stdin_source.kind, nf::Endpoint::Kind::File);
  EXPECT_EQ(stages[0].stdin_source.path, "data.txt");
  EXPECT_EQ(stages[0].stdout_sink.kind, nf::Endpoint::Kind::Pipe);
}

TEST(PipelinePlanner, PlainStdinNeedsNoStages) {
  ResolverFixture f;
  nf::PipelinePlanner planner(f.resolver);
  EXPECT_TRUE(planner.plan(parse_address("-"), Mode::Read).empty());
  EXPECT_EQ(names_of(planner.plan(parse_address("-"), Mode::Write)), Strings{"ndjson_"});

  auto address = parse_address("-~csv");
  auto plan = planner.plan(address, Mode::Read);
  ASSERT_EQ(names_of(plan), Strings{"csv_"});
  EXPECT_EQ(nf::make_read_stages(address, plan, {})[0].stdin_source.kind,
            nf::Endpoint::Kind::Inherit);
}

TEST(PipelinePlanner, RemoteFileSplitsIntoFetchAndParse) {
  ResolverFixture f;
  nf::PipelinePlanner planner(f.resolver);
  auto address = parse_address("https://example.com/data.csv");
  auto plan = planner.plan(address, Mode::Read);
  ASSERT_EQ(names_of(plan), (Strings{"http", "csv_"}));
  EXPECT_EQ(modes_of(plan), (Strings{"raw", "read"}));
  EXPECT_EQ(plan[0].url.value_or(""), "https://example.com/data.csv");
  EXPECT_FALSE(plan[1].url.has_value());

  auto stages = nf::make_read_stages(address, plan, {});
  ASSERT_EQ(stages.size(), 2u);
  EXPECT_EQ(stages[0].stdin_source.kind, nf::Endpoint::Kind::Null);
  EXPECT_EQ(stages[0].argv.back(), "https://example.com/data.csv");
  EXPECT_EQ(stages[1].role, nf::StageRole::Filter);
  EXPECT_EQ(stages[1].stdin_source.kind, nf::Endpoint::Kind::Pipe);
}

TEST(PipelinePlanner, FormatOverrideOnUrlUsesHttpForHttps) {
  ResolverFixture f;
  nf::PipelinePlanner planner(f.resolver);
  auto plan = planner.plan(parse_address("https://example.com/export~csv?delimiter=%7C"), Mode::Read);
  ASSERT_EQ(names_of(plan), (Strings{"http", "csv_"}));
  EXPECT_EQ(plan[0].url.value_or(""), "https://example.com/export");
  EXPECT_EQ(plan[1].config.at("delimiter"), nf::ConfigValue(std::string("|")));
}

TEST(PipelinePlanner, UrlWithoutFormatIsFetchedByTheProtocolPlugin) {
  ResolverFixture f;
  nf::PipelinePlanner planner(f.resolver);
  auto plan = planner.plan(parse_address("https://example.com/api/items"), Mode::Read);
  ASSERT_EQ(names_of(plan), Strings{"http"});
  EXPECT_EQ(modes_of(plan), Strings{"read"});
  EXPECT_EQ(nf::build_argv(plan[0], {}).back(), "https://example.com/api/items");
}

TEST(PipelinePlanner, CompressedFileIsDecompressedFirst) {
  ResolverFixture f;
  nf::PipelinePlanner planner(f.resolver);
  auto address = parse_address("events.csv.gz");
  auto plan = planner.plan(address, Mode::Read);
  ASSERT_EQ(names_of(plan), (Strings{"gz_", "csv_"}));
  EXPECT_EQ(modes_of(plan), (Strings{"raw", "read"}));

  auto stages = nf::make_read_stages(address, plan, {});
  EXPECT_EQ(stages[0].stdin_source.path, "events.csv.gz");
}

TEST(PipelinePlanner, CompressedUrlDecompressesBetweenFetchAndParse) {
  ResolverFixture f;
  nf::PipelinePlanner planner(f.resolver);
  auto plan = planner.plan(parse_address("https://example.com/events.csv.gz"), Mode::Read);
  ASSERT_EQ(names_of(plan), (Strings{"http", "gz_", "csv_"}));
  EXPECT_EQ(plan[0].url.value_or(""), "https://example.com/events.csv.gz");
}

TEST(PipelinePlanner, CompressionErrors) {
  ResolverFixture f;
  nf::PipelinePlanner planner(f.resolver);
  try {
    planner.plan(parse_address("out.csv.gz"), Mode::Write);
    FAIL() << "expected a resolution error";
  } catch (const nf::FlowError& e) {
    EXPECT_EQ(e.code(), nf::FlowErrc::Resolution);
    EXPECT_NE(std::string(e.what()).find("compressed output"), std::string::npos);
  }
  EXPECT_THROW(planner.plan(parse_address("in.csv.xz"), Mode::Read), nf::FlowError);
}

TEST(PipelinePlanner, ProfileHeadersGoBeforeTheUrl) {
  ResolverFixture f;
  nf_test::write_file(f.home() / "profiles" / "http" / "api" / "_meta.json",
                      R"({"base_url": "https://api.example", "headers": {"X-Key": "k1"}, "params": []})");
  nf::PipelinePlanner planner(f.resolver);
  std::vector<std::string> warnings;
  auto plan = planner.plan(parse_address("@api?limit=1"), Mode::Read, &warnings);
  ASSERT_EQ(plan.size(), 1u);
  EXPECT_EQ(nf::build_argv(plan[0], {"uv", "run", "--script"}),
            (Strings{"uv", "run", "--script", "/opt/ndflow/plugins/protocols/http.py", "--mode", "read",
                     "--headers", R"({"X-Key":"k1"})", "https://api.example?limit=1"}));
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("limit"), std::string::npos);
}

TEST(PipelinePlanner, EmptyHeadersAreOmitted) {
  nf::PlannedStage s;
  s.plugin_path = "/p/http.py";
  s.mode = Mode::Read;
  s.url = "https://x";
  s.headers = std::map<std::string, std::string>{};
  EXPECT_EQ(nf::build_argv(s, {}), (Strings{"/p/http.py", "--mode", "read", "https://x"}));
}

TEST(PipelinePlanner, WriteStageEndpoints) {
  ResolverFixture f;
  nf::PipelinePlanner planner(f.resolver);

  auto file = parse_address("out.json");
  auto to_file = nf::make_write_stage(file, planner.plan(file, Mode::Write).front(), {});
  EXPECT_EQ(to_file.role, nf::StageRole::Target);
  EXPECT_EQ(to_file.stdin_source.kind, nf::Endpoint::Kind::Pipe);
  EXPECT_EQ(to_file.stdout_sink.kind, nf::Endpoint::Kind::File);
  EXPECT_EQ(to_file.stdout_sink.path, "out.json");
  EXPECT_EQ(to_file.argv, (Strings{"/opt/ndflow/plugins/formats/json_.py", "--mode", "write"}));

  auto out = parse_address("-~csv");
  auto to_stdout = nf::make_write_stage(out, planner.plan(out, Mode::Write).front(), {});
  EXPECT_EQ(to_stdout.stdout_sink.kind, nf::Endpoint::Kind::Inherit);
}

TEST(PipelinePlanner, FilterStageCarriesExtraArguments) {
  ResolverFixture f;
  nf::PipelinePlanner planner(f.resolver);
  auto plan = planner.plan(parse_address("@gz_"), Mode::Filter);
  ASSERT_EQ(names_of(plan), Strings{"gz_"});
  EXPECT_EQ(modes_of(plan), Strings{"filter"});

  auto stage = nf::make_filter_stage(plan[0], {"-d", "x y"}, {"uv", "run"});
  EXPECT_EQ(stage.role, nf::StageRole::Filter);
  EXPECT_EQ(stage.name, "gz_");
  EXPECT_EQ(stage.argv, (Strings{"uv", "run", "/opt/ndflow/plugins/compression/gz_.py", "--mode",
                                 "filter", "-d", "x y"}));
  EXPECT_EQ(stage.stdin_source.kind, nf::Endpoint::Kind::Pipe);
  EXPECT_EQ(stage.stdout_sink.kind, nf::Endpoint::Kind::Pipe);

  // Formats only read and write; compressed names are not filters.
  EXPECT_THROW(planner.plan(parse_address("data.csv"), Mode::Filter), nf::FlowError);
  try {
    planner.plan(parse_address("data.csv.gz"), Mode::Filter);
    FAIL() << "expected a resolution error";
  } catch (const nf::FlowError& e) {
    EXPECT_EQ(e.code(), nf::FlowErrc::Resolution);
    EXPECT_NE(std::string(e.what()).find("cannot name a filter"), std::string::npos);
  }
}
