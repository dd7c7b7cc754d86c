#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include <limits>

#include "utilities.hpp"

namespace fs = std::filesystem;

TEST_CASE("read_exact throws when size exceeds streamsize") {
    fs::path tmp = fs::temp_directory_path() / "replay_too_big_read.bin";
    {
        std::ofstream out(tmp, std::ios::binary);
        // fichier vide
    }
    std::ifstream in(tmp, std::ios::binary);
    char dummy = 0;
    size_t big = static_cast<size_t>(std::numeric_limits<std::streamsize>::max()) + 1;
    REQUIRE_THROWS(replay::read_exact(in, &dummy, big));
    REQUIRE_THROWS(replay::checked_streamsize(big));
    CHECK(replay::checked_streamsize(16) == 16);
    in.close();
    fs::remove(tmp);
}

TEST_CASE("read_scalar_le rejects short buffers") {
    std::byte two[2] = {std::byte{0x34}, std::byte{0x12}};
    CHECK(replay::read_scalar_le<uint16_t>(two) == 0x1234);
    CHECK(replay::read_scalar_le<uint8_t>(two) == 0x34);
    REQUIRE_THROWS_AS(replay::read_scalar_le<uint32_t>(two), std::runtime_error);
}
