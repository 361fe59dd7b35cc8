#include <catch2/catch.hpp>
#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "test_support.hpp"
#include <fstream>

TEST_CASE("Missing config file keeps the defaults") {
  auto cfg = fsk::Config::load("fskmodem_test_no_such.conf");
  REQUIRE(cfg.modulation.center_freq_hz == 10000.0);
  REQUIRE(cfg.modulation.deviation_hz == 500.0);
  REQUIRE(cfg.modulation.baud_rate == 100.0);
  REQUIRE(cfg.modulation.sample_rate == 44100.0);
  REQUIRE(cfg.analysis.window_size == 0);
  REQUIRE(cfg.amplitude == 1.0f);
  REQUIRE(cfg.log_level == "info");
}

TEST_CASE("Config file values override defaults") {
  fsk::test::TempFile tmp("modem.conf");
  {
    std::ofstream f(tmp.path());
    f << "# modem settings\n"
         "center_freq = 2000\n"
         "deviation=400   # Hz\n"
         "bit_duration = 0.005\n"
         "sample_rate = 48000\n"
         "window_size = 128\n"
         "hop_size = 16\n"
         "search_margin = 250\n"
         "amplitude = 0.8\n"
         "log_level = debug\n"
         "colour = blue\n"
         "not a setting\n";
  }
  auto cfg = fsk::Config::load(tmp.path());
  REQUIRE(cfg.modulation.center_freq_hz == 2000.0);
  REQUIRE(cfg.modulation.deviation_hz == 400.0);
  REQUIRE(cfg.modulation.baud_rate == Approx(200.0));
  REQUIRE(cfg.modulation.sample_rate == 48000.0);
  REQUIRE(cfg.analysis.window_size == 128);
  REQUIRE(cfg.analysis.hop_size == 16);
  REQUIRE(cfg.analysis.search_margin_hz == 250.0);
  REQUIRE(cfg.amplitude == Approx(0.8f));
  REQUIRE(cfg.log_level == "debug");
}

TEST_CASE("Malformed numbers are configuration errors") {
  fsk::Config cfg;
  REQUIRE_THROWS_AS(cfg.set("deviation", "lots"), fsk::ConfigurationError);
  REQUIRE_THROWS_AS(cfg.set("baud_rate", "100baud"), fsk::ConfigurationError);
  REQUIRE_THROWS_AS(cfg.set("window_size", "12.5"), fsk::ConfigurationError);
  REQUIRE_THROWS_AS(cfg.set("bit_duration", "0"), fsk::ConfigurationError);
  REQUIRE_FALSE(cfg.set("unknown", "1"));
  REQUIRE(cfg.set("frequency", "1200"));
  REQUIRE(cfg.modulation.center_freq_hz == 1200.0);
}

TEST_CASE("Log levels parse from names and numbers") {
  using fsk::log::Level;
  REQUIRE(fsk::log::level_from_string("DEBUG") == Level::Debug);
  REQUIRE(fsk::log::level_from_string("10") == Level::Debug);
  REQUIRE(fsk::log::level_from_string("20") == Level::Info);
  REQUIRE(fsk::log::level_from_string("warning") == Level::Warn);
  REQUIRE(fsk::log::level_from_string("30") == Level::Warn);
  REQUIRE(fsk::log::level_from_string("critical") == Level::Error);
  REQUIRE(fsk::log::level_from_string("50") == Level::Error);
  REQUIRE(fsk::log::level_from_string("bogus") == Level::Info);

  fsk::log::init(Level::Warn);
  REQUIRE_FALSE(fsk::log::enabled(Level::Info));
  REQUIRE(fsk::log::enabled(Level::Error));
  fsk::log::init(Level::Info);
}
