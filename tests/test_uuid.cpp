#include <chtest.hpp>

#include <chremote/core/uuid.h>

#include <set>

TEST_CASE("NewUuid produces version 4 uuids") {
    auto id = chremote::NewUuid();
    REQUIRE(id.size() == 36);
    REQUIRE(chremote::IsUuid(id));
    REQUIRE(id[14] == '4');
    REQUIRE(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
}

TEST_CASE("NewUuid does not repeat") {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(chremote::NewUuid());
    }
    REQUIRE(seen.size() == 1000);
}

TEST_CASE("IsUuid rejects malformed input") {
    REQUIRE(!chremote::IsUuid(""));
    REQUIRE(!chremote::IsUuid("not-a-uuid"));
    REQUIRE(!chremote::IsUuid("123e4567-e89b-12d3-a456-426614174000")); // version 1
    REQUIRE(!chremote::IsUuid("123E4567-E89B-42D3-A456-426614174000")); // uppercase
    REQUIRE(chremote::IsUuid("123e4567-e89b-42d3-a456-426614174000"));
}
