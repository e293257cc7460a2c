#include <catch2/catch.hpp>
#include <chv/version.hpp>

using namespace chv;

// ===== Version =====

TEST_CASE("parse exact versions", "[version]") {
    auto v = Version::parse("25.12.5.44");
    REQUIRE(v.is_ok());
    REQUIRE(v.value().major == 25);
    REQUIRE(v.value().minor == 12);
    REQUIRE(v.value().patch == 5);
    REQUIRE(v.value().build == 44);
    REQUIRE(v.value().to_string() == "25.12.5.44");

    REQUIRE(Version::parse("v24.3.1.2").value().to_string() == "24.3.1.2");
    REQUIRE(Version::parse("0.0.0.0").is_ok());
}

TEST_CASE("reject malformed exact versions", "[version]") {
    const char* bad[] = {
        "", "25", "25.12", "25.12.5", "25.12.5.44.1", "25..5.44",
        "25.12.5.", "a.b.c.d", "25.12.5.44-stable", "25.12.5.1234567890",
    };
    for (const char* s : bad) {
        auto r = Version::parse(s);
        INFO(s);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == ChvError::InvalidArg);
    }
}

TEST_CASE("versions compare component by component", "[version]") {
    auto v = [](const char* s) { return Version::parse(s).value(); };
    REQUIRE(v("25.12.5.44") > v("25.12.5.9"));
    REQUIRE(v("25.12.5.44") < v("25.13.0.1"));
    REQUIRE(v("24.12.9.99") < v("25.1.1.1"));
    REQUIRE(v("25.1.1.1") == v("v25.1.1.1"));
    REQUIRE(v("25.1.1.1") != v("25.1.1.2"));
    REQUIRE(v("25.1.1.1") <= v("25.1.1.1"));
    REQUIRE(v("25.1.1.1") >= v("25.1.1.1"));
}

// ===== VersionSpec =====

TEST_CASE("spec keywords", "[version][spec]") {
    REQUIRE(VersionSpec::parse("stable").value().kind == VersionSpec::Kind::Stable);
    REQUIRE(VersionSpec::parse("LTS").value().kind == VersionSpec::Kind::Lts);
    REQUIRE(VersionSpec::parse("  stable ").value().kind == VersionSpec::Kind::Stable);
}

TEST_CASE("partial specs keep their prefix", "[version][spec]") {
    auto one = VersionSpec::parse("25").value();
    REQUIRE(one.kind == VersionSpec::Kind::Partial);
    REQUIRE(one.prefix == std::vector<int>{25});

    auto three = VersionSpec::parse("25.12.5").value();
    REQUIRE(three.kind == VersionSpec::Kind::Partial);
    REQUIRE(three.prefix == std::vector<int>{25, 12, 5});
    REQUIRE(three.to_string() == "25.12.5");
}

TEST_CASE("four components make an exact spec", "[version][spec]") {
    auto s = VersionSpec::parse("25.12.5.44").value();
    REQUIRE(s.is_exact());
    REQUIRE(s.exact == Version::parse("25.12.5.44").value());
    REQUIRE(s.to_string() == "25.12.5.44");
}

TEST_CASE("invalid specs", "[version][spec]") {
    const char* bad[] = {"", "   ", "latest", "25.x", "25.12.5.44.1", "25.", ".25"};
    for (const char* s : bad) {
        INFO(s);
        auto r = VersionSpec::parse(s);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == ChvError::InvalidArg);
    }
}

TEST_CASE("matches_prefix", "[version][spec]") {
    auto v = Version::parse("25.12.5.44").value();
    REQUIRE(VersionSpec::parse("25").value().matches_prefix(v));
    REQUIRE(VersionSpec::parse("25.12").value().matches_prefix(v));
    REQUIRE_FALSE(VersionSpec::parse("25.1").value().matches_prefix(v));
    REQUIRE(VersionSpec::of(v).matches_prefix(v));
    REQUIRE_FALSE(VersionSpec::stable().matches_prefix(v));
    REQUIRE_FALSE(VersionSpec::lts().matches_prefix(v));
}
