//Catch includes
#include <catch2/catch_test_macros.hpp>

//Our includes
#include "LfsErrors.h"

using namespace QLfs;

TEST_CASE("LfsErrors maps result codes to error kinds", "[LFS]") {
    CHECK(LfsErrors::kind(0) == LfsErrors::Kind::None);
    CHECK(LfsErrors::kind(static_cast<int>(LfsErrorCode::Configuration)) == LfsErrors::Kind::Configuration);
    CHECK(LfsErrors::kind(static_cast<int>(LfsErrorCode::Transfer)) == LfsErrors::Kind::Transfer);
    CHECK(LfsErrors::kind(static_cast<int>(LfsErrorCode::Network)) == LfsErrors::Kind::Network);
    CHECK(LfsErrors::kind(static_cast<int>(LfsErrorCode::Io)) == LfsErrors::Kind::Io);
    CHECK(LfsErrors::kind(42) == LfsErrors::Kind::Unknown);

    SECTION("Http statuses are protocol errors") {
        CHECK(LfsErrors::kind(404) == LfsErrors::Kind::Protocol);
        CHECK(LfsErrors::kind(500) == LfsErrors::Kind::Protocol);
        CHECK(LfsErrors::httpStatus(500) == 500);
        CHECK(LfsErrors::httpStatus(static_cast<int>(LfsErrorCode::Protocol)) == 0);
    }

    CHECK(LfsErrors::kindName(LfsErrors::Kind::Transfer).toStdString() == "transfer");
}
