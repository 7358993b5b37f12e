#pragma once

#include <concepts>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "espflasher/common/constants.hpp"
#include "espflasher/common/utility.hpp"

namespace espflasher {

class ProviderError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief One contiguous write job. The bytes are borrowed from the image provider and must outlive the flash call.
 */
struct FlashRegion {
  std::span<std::uint8_t const> data_;
  std::uint32_t address_;

  [[nodiscard]] std::uint32_t size() const noexcept { return static_cast<std::uint32_t>(this->data_.size()); }

  [[nodiscard]] std::uint32_t erase_size() const noexcept { return padded_size(this->size(), FLASH_ERASE_BLOCK_SIZE); }

  [[nodiscard]] std::uint32_t erase_blocks() const noexcept {
    return div_ceil(this->size(), FLASH_ERASE_BLOCK_SIZE);
  }

  [[nodiscard]] std::uint32_t chunk_count(std::uint32_t const t_chunk_size) const noexcept {
    return div_ceil(this->size(), t_chunk_size);
  }
};

template <typename P>
concept ImageProvider = requires(P t_provider, std::string_view t_version) {
  { t_provider.load(t_version) } -> std::same_as<std::vector<FlashRegion>>;
};

struct ImagePart {
  std::uint32_t address_;
  std::filesystem::path path_;
};

/**
 * @brief Reads every part of a firmware version from <root>/<version>/<part path>, in the order given. Addresses are
 *        taken as they are, checking them against the partition table is the caller's business.
 */
class FileImageProvider {
  std::filesystem::path root_;
  std::vector<ImagePart> parts_;
  std::vector<std::vector<std::uint8_t>> contents_;

  static std::vector<std::uint8_t> read_file(std::filesystem::path const& t_file) {
    std::ifstream file(t_file, std::ios::binary | std::ios::in);
    if (not file.good()) {
      throw ProviderError(fmt::format("Cannot open firmware file {}", t_file.string()));
    }

    std::vector<std::uint8_t> content;
    content.insert(content.begin(), std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
      throw ProviderError(fmt::format("Failed reading firmware file {}", t_file.string()));
    }

    return content;
  }

 public:
  FileImageProvider(std::filesystem::path t_root, std::vector<ImagePart> t_parts)
    : root_{std::move(t_root)}, parts_{std::move(t_parts)} {}

  std::vector<FlashRegion> load(std::string_view const t_version) {
    if (this->parts_.empty()) {
      throw ProviderError("No firmware part given");
    }

    auto const base = t_version.empty() ? this->root_ : this->root_ / t_version;

    this->contents_.clear();
    this->contents_.reserve(this->parts_.size());
    std::vector<FlashRegion> regions;
    regions.reserve(this->parts_.size());

    for (auto const& [address, path] : this->parts_) {
      auto const file = path.is_absolute() ? path : base / path;
      auto& content   = this->contents_.emplace_back(read_file(file));
      if (content.empty()) {
        throw ProviderError(fmt::format("Firmware file {} is empty", file.string()));
      }

      spdlog::info("Reading file: {}, file size: {}, flash offset: {:#x}", file.string(), content.size(), address);
      regions.push_back(FlashRegion{content, address});
    }

    return regions;
  }
};

static_assert(ImageProvider<FileImageProvider>);

}  // namespace espflasher
