#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "internal/util/date.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace famgraph::util;

void TestIsoDates() {
  assert(IsValidIsoDate("1850-03-01"));
  assert(IsValidIsoDate("2000-02-29"));
  assert(!IsValidIsoDate("1900-02-29"));
  assert(!IsValidIsoDate("2023-13-01"));
  assert(!IsValidIsoDate("2023-04-31"));
  assert(!IsValidIsoDate("1850"));
  assert(!IsValidIsoDate("1850-3-1"));
  assert(!IsValidIsoDate("0000-01-01"));
  assert(!IsValidIsoDate("abcd-ef-gh"));

  assert(*ParseIsoDate("1850-03-01") < *ParseIsoDate("1850-03-02"));
  assert(*ParseIsoDate("1849-12-31") < *ParseIsoDate("1850-01-01"));
}

void TestStrings() {
  assert(Trim("  Ada \t") == "Ada");
  assert(Trim("   ").empty());
  assert(ToLower("McKay") == "mckay");
  assert(NormalizeName("  Ada   LOVELACE ") == "ada lovelace");
  assert(ContainsIgnoreCase("Lovelace", "LACE"));
  assert(!ContainsIgnoreCase("Lovelace", "byron"));
}

void TestUuids() {
  std::set<std::string> ids;
  for (int i = 0; i < 256; ++i) {
    const auto id = NewId();
    assert(id.size() == 36);
    assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
    assert(id[14] == '4');
    ids.insert(id);
  }
  assert(ids.size() == 256);
}

} // namespace

int main() {
  TestIsoDates();
  TestStrings();
  TestUuids();

  std::cout << "famgraph_unit_util: pass\n";
  return 0;
}
