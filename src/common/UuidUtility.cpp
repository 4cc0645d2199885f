#include "common/UuidUtility.h"

#include <algorithm>
#include <array>
#include <functional>
#include <random>

uuids::uuid generateRandomUuid()
{
  std::random_device rd;
  auto seedData = std::array<int, std::mt19937::state_size>{};
  std::generate(std::begin(seedData), std::end(seedData), std::ref(rd));
  std::seed_seq seq(std::begin(seedData), std::end(seedData));
  std::mt19937 generator(seq);
  return uuids::uuid_random_generator{generator}();
}

std::optional<uuids::uuid> parseUuid(const std::string& uuidString)
{
  return uuids::uuid::from_string(uuidString);
}
