#include <boost/program_options.hpp>

#include <array>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "espflasher/serial/serial_port.hpp"
#include "espflasher/session/config.hpp"
#include "espflasher/session/image.hpp"
#include "espflasher/session/session.hpp"

namespace {

std::uint32_t parse_hex(std::string const& t_str) {
  std::stringstream ss;
  ss << std::hex << t_str;
  std::uint32_t value = 0;
  ss >> value;
  if (ss.fail()) {
    throw std::invalid_argument(fmt::format("\"{}\" is not a hex number", t_str));
  }
  return value;
}

// "0x10000:app.bin"
espflasher::ImagePart parse_part(std::string const& t_part) {
  auto const sep = t_part.find(':');
  if (sep == std::string::npos or sep + 1 == t_part.size()) {
    throw std::invalid_argument(fmt::format("Part \"{}\" must look like ADDRESS:FILE", t_part));
  }
  return espflasher::ImagePart{parse_hex(t_part.substr(0, sep)), t_part.substr(sep + 1)};
}

// "100,50,0": reset hold, boot hold, release hold in ms
espflasher::ResetProfile parse_reset_profile(std::string const& t_profile) {
  std::stringstream ss{t_profile};
  std::array<long, 3> holds{};
  char sep = 0;
  ss >> holds[0] >> sep >> holds[1] >> sep >> holds[2];
  if (ss.fail()) {
    throw std::invalid_argument(fmt::format("Reset profile \"{}\" must look like RESET,BOOT,RELEASE", t_profile));
  }

  using std::chrono::milliseconds;
  return espflasher::ResetProfile{milliseconds(holds[0]), milliseconds(holds[1]), milliseconds(holds[2])};
}

auto flag() { return boost::program_options::value<bool>()->default_value(false)->implicit_value(true); }

}  // namespace

int main(int argc, const char** argv) {
  using namespace boost::program_options;
  options_description flash_options("Parameter for flash");
  flash_options.add_options()                                                                           //
    ("port", value<std::string>(), "Port of connected ESP MCU")                                         //
    ("baud", value<int>()->default_value(115200), "Baudrate of the communication")                      //
    ("dir", value<std::string>()->default_value("."), "Directory holding the firmware versions")        //
    ("fw-version", value<std::string>()->default_value(""), "Firmware version, a sub directory of dir")  //
    ("part", value<std::vector<std::string>>()->composing(),
     "ADDRESS:FILE to write, repeat for every part, written in the given order")  //
    ("chunk-size", value<std::uint32_t>()->default_value(espflasher::DEFAULT_CHUNK_SIZE),
     "Bytes per FLASH_DATA packet, capped by what the loader accepts")  //
    ("flash-size", value<std::string>()->default_value("400000"), "Flash chip size in bytes (hex)");

  options_description session_options("Session tuning");
  session_options.add_options()                                                                         //
    ("sync-cycles", value<std::uint32_t>()->default_value(7), "Reset and sync cycles before giving up")  //
    ("sync-attempts", value<std::uint32_t>()->default_value(5), "SYNC attempts per cycle")              //
    ("sync-timeout", value<int>()->default_value(100), "Timeout of a single SYNC in ms")                //
    ("erase-timeout", value<int>()->default_value(1875), "Erase timeout per 64 KiB block in ms")        //
    ("reset-profile", value<std::vector<std::string>>()->composing(),
     "RESET,BOOT,RELEASE hold times in ms, repeat to give several, tried in order")       //
    ("no-reset", flag(), "Do not toggle DTR/RTS, the chip is put in download mode by hand")  //
    ("no-detect", flag(), "Skip chip detection")                                              //
    ("keep-alive", flag(), "SYNC between regions to check that the chip still answers")      //
    ("resync", flag(), "SYNC once more before rebooting the chip")                            //
    ("stay", flag(), "Do not hard reset the chip after flashing")                             //
    ("direct-reset", flag(), "RTS drives EN and DTR drives IO0 directly, no auto reset transistors")  //
    ("verify", flag(), "Verify flash content after writing");

  options_description visible_options("All options");
  visible_options.add(flash_options)
    .add(session_options)
    .add_options()                                                  //
    ("config", value<std::string>(), "INI file with any of the long options above")  //
    ("help", "Show this help message and exit")                                        //
    ("verbose", "Show debug message during execution");

  options_description file_options;
  file_options.add(flash_options).add(session_options);

  variables_map vm;
  try {
    store(command_line_parser(argc, argv).options(visible_options).run(), vm);
    if (vm.count("config") != 0) {
      store(parse_config_file<char>(vm["config"].as<std::string>().c_str(), file_options), vm);
    }
    notify(vm);
  } catch (error const& t_e) {
    std::cerr << t_e.what() << '\n';
    return EXIT_FAILURE;
  }

  if (vm.count("help") != 0) {
    std::cout << visible_options << '\n';
    return EXIT_SUCCESS;
  }

  if (vm.count("port") == 0) {
    std::cerr << "Must specifiy a port!\n";
    return EXIT_FAILURE;
  }

  if (vm.count("part") == 0) {
    std::cerr << "Must specifiy at least one part!\n";
    return EXIT_FAILURE;
  }

  if (vm.count("verbose") != 0) {
    spdlog::set_level(spdlog::level::debug);
  }

  espflasher::SessionConfig config;
  std::vector<espflasher::ImagePart> parts;
  try {
    config.baud_rate_                  = static_cast<std::uint32_t>(vm["baud"].as<int>());
    config.chunk_size_                 = vm["chunk-size"].as<std::uint32_t>();
    config.flash_size_                 = parse_hex(vm["flash-size"].as<std::string>());
    config.sync_cycles_                = vm["sync-cycles"].as<std::uint32_t>();
    config.sync_attempts_              = vm["sync-attempts"].as<std::uint32_t>();
    config.sync_timeout_               = std::chrono::milliseconds(vm["sync-timeout"].as<int>());
    config.erase_timeout_per_block_    = std::chrono::milliseconds(vm["erase-timeout"].as<int>());
    config.reset_on_connect_           = not vm["no-reset"].as<bool>();
    config.detect_chip_                = not vm["no-detect"].as<bool>();
    config.keep_alive_between_regions_ = vm["keep-alive"].as<bool>();
    config.resync_before_finalize_     = vm["resync"].as<bool>();
    config.reset_after_flash_          = not vm["stay"].as<bool>();
    config.verify_                     = vm["verify"].as<bool>();

    if (vm.count("reset-profile") != 0) {
      config.reset_profiles_.clear();
      for (auto const& profile : vm["reset-profile"].as<std::vector<std::string>>()) {
        config.reset_profiles_.push_back(parse_reset_profile(profile));
      }
    }

    for (auto const& part : vm["part"].as<std::vector<std::string>>()) {
      parts.push_back(parse_part(part));
    }
  } catch (std::invalid_argument const& t_e) {
    std::cerr << t_e.what() << '\n';
    return EXIT_FAILURE;
  }

  auto const wiring =
    vm["direct-reset"].as<bool>() ? espflasher::ResetWiring::Direct : espflasher::ResetWiring::AutoReset;
  espflasher::FileImageProvider provider{vm["dir"].as<std::string>(), std::move(parts)};
  espflasher::Session<espflasher::SerialPort> session{config, vm["port"].as<std::string>(), wiring};

  std::size_t last_percent = 100;
  auto const report_progress = [&](std::size_t t_region, std::size_t t_written, std::size_t t_total) {
    auto const percent = t_written * 100 / t_total;
    if (percent / 10 != last_percent / 10 or t_written == t_total) {
      spdlog::info("Region {}: {}% ({}/{} bytes)", t_region, percent, t_written, t_total);
    }
    last_percent = t_written == t_total ? 100 : percent;
  };

  // the firmware is loaded before the port is opened, the chip is left alone if a file is missing
  if (session.flash(provider, vm["fw-version"].as<std::string>(), report_progress) !=
      espflasher::SessionState::Rebooted) {
    return EXIT_FAILURE;
  }

  if (config.verify_ and session.verify() == espflasher::Verification::Unavailable) {
    spdlog::warn("--verify given, but the written flash content was not checked");
  }

  return EXIT_SUCCESS;
}
