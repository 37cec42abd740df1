#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace {

using jobsrv::runtime::config::RuntimeConfig;

RuntimeConfig WithLevel(const std::string& level) {
  RuntimeConfig config;
  config.mutable_logging()->set_level(level);
  return config;
}

void TestLevelComesFromConfigUnlessOverridden() {
  unsetenv("JOBSRV_LOG_LEVEL");
  jobsrv::observability::InitializeLogging(WithLevel("warn"));
  assert(spdlog::default_logger()->level() == spdlog::level::warn);

  setenv("JOBSRV_LOG_LEVEL", "debug", 1);
  jobsrv::observability::InitializeLogging(WithLevel("warn"));
  assert(spdlog::default_logger()->level() == spdlog::level::debug);

  setenv("JOBSRV_LOG_LEVEL", "loud", 1);
  bool threw = false;
  try {
    jobsrv::observability::InitializeLogging(WithLevel("warn"));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  unsetenv("JOBSRV_LOG_LEVEL");
}

void TestFieldValuesWithSpacesAreQuoted() {
  unsetenv("JOBSRV_LOG_LEVEL");
  jobsrv::observability::InitializeLogging(WithLevel("info"));

  std::ostringstream out;
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = std::make_shared<spdlog::logger>("capture", sink);
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::info);
  spdlog::set_default_logger(logger);

  JOBSRV_LOG_INFO("worker lost", {jobsrv::observability::StringField("worker_id", "w1"),
                                  jobsrv::observability::StringField("error", "say \"no\" twice"),
                                  jobsrv::observability::IntField("jobs", 2)});
  JOBSRV_LOG_DEBUG("dropped below level", {jobsrv::observability::StringField("worker_id", "w2")});
  logger->flush();

  const auto text = out.str();
  assert(text.find("worker lost worker_id=w1 error=\"say \\\"no\\\" twice\" jobs=2") != std::string::npos);
  assert(text.find("dropped below level") == std::string::npos);
}

} // namespace

int main() {
  TestLevelComesFromConfigUnlessOverridden();
  TestFieldValuesWithSpacesAreQuoted();

  std::cout << "jobsrv_unit_logging: pass\n";
  return 0;
}
