#include "core/decomposer.hpp"

#include "core/tile.hpp"
#include "common/throw.hpp"
#include <vector>
#include <optional>
#include <functional>
#include <utility>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;

void take(Hupai::TileCounts &counts, Hupai::Ordinal const ordinal, std::uint_fast8_t const n)
{
  auto const found = counts.find(ordinal);
  found->second -= n;
  if (found->second == 0u) {
    counts.erase(found);
  }
}

bool has(Hupai::TileCounts const &counts, Hupai::Ordinal const ordinal)
{
  return counts.find(ordinal) != counts.cend();
}

std::optional<Hupai::Decomposition> decompose_(Hupai::TileCounts counts, std::uint_fast8_t const num_sets)
{
  if (num_sets == 0u) {
    if (counts.empty()) {
      return Hupai::Decomposition{};
    }
    return std::nullopt;
  }
  if (counts.empty()) {
    return std::nullopt;
  }

  auto const [first, count] = *counts.cbegin();

  // 刻子 (triplet)
  if (count >= 3u) {
    Hupai::TileCounts rest(counts);
    take(rest, first, 3u);
    if (std::optional<Hupai::Decomposition> result = decompose_(std::move(rest), num_sets - 1u)) {
      result->triplets.insert(result->triplets.cbegin(), first);
      return result;
    }
  }

  // 順子 (sequence)
  if (first < 400u && first % 100u <= 7u && has(counts, first + 1u) && has(counts, first + 2u)) {
    take(counts, first, 1u);
    take(counts, first + 1u, 1u);
    take(counts, first + 2u, 1u);
    if (std::optional<Hupai::Decomposition> result = decompose_(std::move(counts), num_sets - 1u)) {
      result->sequences.insert(result->sequences.cbegin(), first);
      return result;
    }
  }

  return std::nullopt;
}

} // namespace `anonymous`

namespace Hupai{

std::optional<Decomposition> decompose(TileCounts counts, std::uint_fast8_t const num_sets)
{
  if (num_sets > 4u) {
    HUPAI_THROW<std::invalid_argument>(_1)
      << static_cast<unsigned>(num_sets) << ": An invalid number of sets.";
  }
  return decompose_(std::move(counts), num_sets);
}

std::optional<Decomposition> decomposeWithPair(TileCounts const &counts, std::uint_fast8_t const num_sets)
{
  if (num_sets > 4u) {
    HUPAI_THROW<std::invalid_argument>(_1)
      << static_cast<unsigned>(num_sets) << ": An invalid number of sets.";
  }

  // 雀頭 (pair)
  for (auto const &[ordinal, count] : counts) {
    if (count < 2u) {
      continue;
    }
    TileCounts rest(counts);
    take(rest, ordinal, 2u);
    if (std::optional<Decomposition> result = decompose_(std::move(rest), num_sets)) {
      result->pair = ordinal;
      return result;
    }
  }
  return std::nullopt;
}

} // namespace Hupai
