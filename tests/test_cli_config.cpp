#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>

#include "cli_config.hpp"
#include "test_support.hpp"

using nf_test::TempDir;
using nf_test::write_file;

namespace {

// Sets (or unsets) one environment variable for the lifetime of the guard.
class EnvGuard {
 public:
  EnvGuard(const char* name, const char* value) : name_(name) {
    if (const char* old = std::getenv(name)) previous_ = std::string(old);
    if (value) {
      ::setenv(name, value, 1);
    } else {
      ::unsetenv(name);
    }
  }
  ~EnvGuard() {
    if (previous_) {
      ::setenv(name_.c_str(), previous_->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }
  EnvGuard(const EnvGuard&) = delete;
  EnvGuard& operator=(const EnvGuard&) = delete;

 private:
  std::string name_;
  std::optional<std::string> previous_;
};

}  // namespace

TEST(CliConfig, HomeDirectoryPrecedence) {
  EnvGuard home("HOME", "/home/tester");
  EnvGuard xdg("XDG_CONFIG_HOME", nullptr);
  EnvGuard nd("NDFLOW_HOME", nullptr);
  EXPECT_EQ(resolve_home_dir(), "/home/tester/.config/ndflow");
  {
    EnvGuard x("XDG_CONFIG_HOME", "/xdg");
    EXPECT_EQ(resolve_home_dir(), "/xdg/ndflow");
    EnvGuard n("NDFLOW_HOME", "/nd");
    EXPECT_EQ(resolve_home_dir(), "/nd");
    EXPECT_EQ(resolve_home_dir("/explicit"), "/explicit");
  }
  {
    EnvGuard empty("NDFLOW_HOME", "");
    EXPECT_EQ(resolve_home_dir(), "/home/tester/.config/ndflow");
  }
}

TEST(CliConfig, MissingFileKeepsDefaults) {
  TempDir dir;
  CliConfig config;
  config.home = dir.path().string();
  load_or_create_config((dir / "config.yaml").string(), config);
  EXPECT_TRUE(config.loaded_config_path.empty());
  EXPECT_EQ(config.default_head_lines, 10);
  EXPECT_FALSE(config.verbose);
}

TEST(CliConfig, WriteThenLoadRoundTrips) {
  TempDir dir;
  CliConfig config;
  config.home = (dir / "home").string();
  config.plugin_runner = {"uv", "run", "--script"};
  config.profile_dirs = {"/srv/profiles"};
  config.default_head_lines = 25;
  config.verbose = true;

  const auto path = (dir / "nested/config.yaml").string();
  ASSERT_TRUE(write_config_to_file(config, path));
  EXPECT_EQ(nf_test::read_file(path).rfind("# ndflow configuration", 0), 0u);

  CliConfig loaded;
  loaded.home = config.home;
  load_or_create_config(path, loaded);
  EXPECT_FALSE(loaded.loaded_config_path.empty());
  EXPECT_EQ(loaded.plugin_runner, config.plugin_runner);
  EXPECT_EQ(loaded.profile_dirs, config.profile_dirs);
  EXPECT_EQ(loaded.default_head_lines, 25);
  EXPECT_TRUE(loaded.verbose);
  // Unset paths are written out under home.
  EXPECT_EQ(loaded.plugin_dir, (dir / "home/plugins").string());
  EXPECT_EQ(loaded.cache_path, (dir / "home/cache.json").string());
}

TEST(CliConfig, RelativePathsAreAnchoredToTheConfigFile) {
  TempDir dir;
  write_file(dir / "conf/config.yaml",
             "plugin_dir: my_plugins\n"
             "profile_dir: profiles\n"
             "plugin_runner: uv run --script\n"
             "cache_path: /abs/cache.json\n");
  CliConfig config;
  load_or_create_config((dir / "conf/config.yaml").string(), config);
  EXPECT_EQ(config.plugin_dir, (dir / "conf/my_plugins").string());
  EXPECT_EQ(config.profile_dirs, std::vector<std::string>{(dir / "conf/profiles").string()});
  EXPECT_EQ(config.plugin_runner, (std::vector<std::string>{"uv", "run", "--script"}));
  EXPECT_EQ(config.cache_path, "/abs/cache.json");
}

TEST(CliConfig, UnparsableFileWarnsAndKeepsDefaults) {
  TempDir dir;
  CliConfig config;
  config.plugin_dir = "/keep";

  write_file(dir / "bad.yaml", "plugin_dir: [unterminated\n");
  testing::internal::CaptureStderr();
  load_or_create_config((dir / "bad.yaml").string(), config);
  std::string err = testing::internal::GetCapturedStderr();
  EXPECT_NE(err.find("Warning: Could not parse config file"), std::string::npos);
  EXPECT_EQ(config.plugin_dir, "/keep");

  write_file(dir / "negative.yaml", "plugin_dir: /changed\ndefault_head_lines: -1\n");
  testing::internal::CaptureStderr();
  load_or_create_config((dir / "negative.yaml").string(), config);
  err = testing::internal::GetCapturedStderr();
  EXPECT_NE(err.find("default_head_lines"), std::string::npos);
  EXPECT_EQ(config.plugin_dir, "/keep");
  EXPECT_EQ(config.default_head_lines, 10);

  write_file(dir / "list.yaml", "- a\n- b\n");
  testing::internal::CaptureStderr();
  load_or_create_config((dir / "list.yaml").string(), config);
  err = testing::internal::GetCapturedStderr();
  EXPECT_NE(err.find("top level must be a mapping"), std::string::npos);
  EXPECT_TRUE(config.loaded_config_path.empty());
}

TEST(CliConfig, EffectiveYamlAndKernelOptions) {
  CliConfig config;
  config.home = "/h";
  config.plugin_runner = {"python3"};
  const std::string yaml = config_to_yaml(config);
  EXPECT_NE(yaml.find("plugin_dir: /h/plugins"), std::string::npos);
  EXPECT_NE(yaml.find("gmail_profile_dir: /h/profiles/gmail"), std::string::npos);
  EXPECT_NE(yaml.find("default_head_lines: 10"), std::string::npos);

  auto opts = to_kernel_options(config);
  EXPECT_EQ(opts.home, nf::fs::path("/h"));
  EXPECT_TRUE(opts.plugin_dir.empty());
  EXPECT_EQ(opts.plugin_runner, std::vector<std::string>{"python3"});
}
