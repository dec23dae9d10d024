#include "radial/core/ring_model.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace radial::core {

namespace {

struct RingCandidate {
  std::string key{};
  std::string name{};
  std::optional<Rgba> color{};
};

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string NormalizeCategoryKey(std::string_view name) {
  std::size_t begin = 0;
  std::size_t end = name.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(name[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(name[end - 1]))) {
    --end;
  }
  std::string key(name.substr(begin, end - begin));
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return key;
}

std::optional<Rgba> ParseHexColor(std::string_view text) {
  if (text.empty() || text.front() != '#') {
    return std::nullopt;
  }
  const std::string_view digits = text.substr(1);
  for (char c : digits) {
    if (hex_value(c) < 0) {
      return std::nullopt;
    }
  }
  if (digits.size() == 3) {
    const auto expand = [](char c) { return static_cast<std::uint8_t>(hex_value(c) * 17); };
    return Rgba{expand(digits[0]), expand(digits[1]), expand(digits[2]), 0xff};
  }
  if (digits.size() == 6 || digits.size() == 8) {
    const auto byte_at = [&](std::size_t i) {
      return static_cast<std::uint8_t>(hex_value(digits[i]) * 16 + hex_value(digits[i + 1]));
    };
    const std::uint8_t alpha = digits.size() == 8 ? byte_at(6) : 0xff;
    return Rgba{byte_at(0), byte_at(2), byte_at(4), alpha};
  }
  return std::nullopt;
}

std::string FormatHexColor(const Rgba& color) {
  std::ostringstream oss;
  oss << "#" << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(color.r) << std::setw(2)
      << static_cast<int>(color.g) << std::setw(2) << static_cast<int>(color.b);
  return oss.str();
}

RingModel RingModel::Build(const std::vector<Activity>& activities,
                           const std::vector<CategorySpec>& categories,
                           double circle_radius) {
  std::vector<RingCandidate> candidates;
  std::unordered_set<std::string> seen;
  for (const CategorySpec& spec : categories) {
    std::string key = NormalizeCategoryKey(spec.name);
    if (key.empty() || !seen.insert(key).second) {
      continue;
    }
    candidates.push_back({std::move(key), spec.name, ParseHexColor(spec.color)});
  }
  for (const Activity& activity : activities) {
    std::string key = NormalizeCategoryKey(activity.category);
    if (key.empty() || !seen.insert(key).second) {
      continue;
    }
    candidates.push_back({key, key, std::nullopt});
  }

  RingModel model;
  model.circle_radius_ = circle_radius;
  model.candidate_count_ = candidates.size();
  const std::size_t ring_count = std::min(candidates.size(), kMaxRings);
  const double step =
      ring_count <= 1 ? 0.0 : (kOuterRingFactor - kInnerRingFactor) / static_cast<double>(ring_count - 1);
  for (std::size_t i = 0; i < ring_count; ++i) {
    Ring ring{};
    ring.category_key = candidates[i].key;
    ring.name = candidates[i].name;
    ring.radius = circle_radius * (kOuterRingFactor - static_cast<double>(i) * step);
    ring.color = candidates[i].color.value_or(kRingPalette[i % kRingPalette.size()]);
    model.rings_.push_back(std::move(ring));
  }
  return model;
}

const Ring* RingModel::find(std::string_view key) const {
  for (const Ring& ring : rings_) {
    if (ring.category_key == key) {
      return &ring;
    }
  }
  return nullptr;
}

std::string RingModel::ResolveKey(std::string_view category) const {
  std::string key = NormalizeCategoryKey(category);
  if (find(key) != nullptr) {
    return key;
  }
  if (!rings_.empty()) {
    return rings_.front().category_key;
  }
  return key;
}

double RingModel::RadiusFor(std::string_view category) const {
  const Ring* ring = find(ResolveKey(category));
  return ring != nullptr ? ring->radius : circle_radius_ * kFallbackRingFactor;
}

Rgba RingModel::ColorFor(std::string_view category) const {
  const Ring* ring = find(ResolveKey(category));
  return ring != nullptr ? ring->color : kFallbackRingColor;
}

}  // namespace radial::core
