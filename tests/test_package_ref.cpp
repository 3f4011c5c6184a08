#include <gtest/gtest.h>
#include "../src/package_ref.hpp"
#include "../src/exception.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(PackageRefTest, PlainName) {
    auto ref = parse_package_spec("requests");
    EXPECT_EQ(ref.name, "requests");
    EXPECT_FALSE(ref.version.has_value());
}

TEST(PackageRefTest, ExactPinKeepsVersion) {
    auto ref = parse_package_spec("Keras==3.11.2");
    EXPECT_EQ(ref.name, "keras");
    EXPECT_EQ(ref.version, "3.11.2");

    auto spaced = parse_package_spec("  numpy == 2.3.5 ");
    EXPECT_EQ(spaced.name, "numpy");
    EXPECT_EQ(spaced.version, "2.3.5");
}

TEST(PackageRefTest, ArbitraryEqualityIsAnExactPin) {
    auto ref = parse_package_spec("Keras===3.11.2");
    EXPECT_EQ(ref.name, "keras");
    EXPECT_EQ(ref.version, "3.11.2");
}

TEST(PackageRefTest, RangeOperatorsDropVersion) {
    for (const std::string spec : {"django>=4.0", "django<=4.0", "django>4.0", "django<4.0", "django~=4.0", "django!=4.0"}) {
        auto ref = parse_package_spec(spec);
        EXPECT_EQ(ref.name, "django") << spec;
        EXPECT_FALSE(ref.version.has_value()) << spec;
    }
}

TEST(PackageRefTest, LowerCasingIsIdempotent) {
    auto once = parse_package_spec("PyYAML");
    auto twice = parse_package_spec(once.name);
    EXPECT_EQ(once.name, "pyyaml");
    EXPECT_EQ(once.name, twice.name);
}

TEST(PackageRefTest, EmptyNameThrows) {
    EXPECT_THROW(parse_package_spec("==1.0"), PipwallException);
    EXPECT_THROW(parse_package_spec("   "), PipwallException);
}

class RequirementsFileTest : public ::testing::Test {
protected:
    fs::path work_dir;

    void SetUp() override {
        work_dir = fs::absolute("tmp_requirements_test");
        fs::create_directories(work_dir);
    }

    void TearDown() override {
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
    }
};

TEST_F(RequirementsFileTest, SkipsCommentsAndBlankLines) {
    const fs::path req = work_dir / "requirements.txt";
    {
        std::ofstream f(req);
        f << "# pinned deps\n"
          << "requests==2.32.0\n"
          << "\n"
          << "  keras>=3.0   # inline comment\n"
          << "numpy\r\n";
    }

    auto packages = parse_requirements_file(req);
    EXPECT_EQ(packages, (std::vector<std::string>{"requests==2.32.0", "keras>=3.0", "numpy"}));
}

TEST_F(RequirementsFileTest, MissingFileThrows) {
    EXPECT_THROW(parse_requirements_file(work_dir / "nope.txt"), PipwallException);
}
