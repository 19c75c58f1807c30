#include <catch2/catch_test_macros.hpp>
#include "app/Cli.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace seamlod;

namespace {

// 每个测试使用独立的临时目录，结束时删除
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / ("seamlod_cli_" + name)) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

void writePly(const std::filesystem::path& path, const std::string& faces, size_t faceCount) {
    std::ofstream out(path, std::ios::binary);
    out << "ply\n"
        << "format ascii 1.0\n"
        << "element vertex 4\n"
        << "property float x\n"
        << "property float y\n"
        << "property float z\n"
        << "element face " << faceCount << "\n"
        << "property list uchar int vertex_indices\n"
        << "end_header\n"
        << "0 0 0\n"
        << "1 0 0\n"
        << "1 1 0\n"
        << "0 1 0\n"
        << faces;
}

app::CommandLineOptions quietOptions(const TempDir& dir, const std::string& input) {
    app::CommandLineOptions opts;
    opts.inputFile = (dir.path() / input).string();
    opts.outputDir = (dir.path() / "out").string();
    opts.gridSize = 2;
    opts.ratios = {1.0, 0.5};
    opts.quiet = true;
    opts.showProgress = false;
    return opts;
}

nlohmann::json readReport(const TempDir& dir) {
    std::ifstream in(dir.path() / "out" / "report.json");
    REQUIRE(in.is_open());
    return nlohmann::json::parse(in);
}

} // namespace

TEST_CASE("CLI writes a report when the input cannot be read", "[cli]") {
    TempDir dir("missing");
    const auto opts = quietOptions(dir, "missing.ply");

    REQUIRE(app::runCli(opts) == 1);

    const auto report = readReport(dir);
    REQUIRE(report["state"] == "Failed");
    REQUIRE(report["succeeded"] == false);
    REQUIRE(report["failure"]["stage"] == "Idle");
    REQUIRE(report["failure"]["code"] == "IoError");
    REQUIRE(report["failure"]["component"] == "PlyReader");
    REQUIRE(report["tiles"].empty());
}

TEST_CASE("CLI writes a report when the input geometry is invalid", "[cli]") {
    TempDir dir("invalid");
    writePly(dir.path() / "broken.ply", "3 0 1 2\n3 0 2 7\n", 2);
    const auto opts = quietOptions(dir, "broken.ply");

    REQUIRE(app::runCli(opts) == 1);

    const auto report = readReport(dir);
    REQUIRE(report["name"] == "broken");
    REQUIRE(report["state"] == "Failed");
    REQUIRE(report["failure"]["stage"] == "Cleaning");
    REQUIRE(report["failure"]["code"] == "InvalidGeometry");
    REQUIRE(report["failure"]["component"] == "HostMesh");
    REQUIRE(report["run"]["stages"][0]["stage"] == "Cleaning");
    REQUIRE(report["run"]["stages"][0]["status"] == "Failed");
    REQUIRE(report["files"].empty());
}

TEST_CASE("CLI writes a report for an invalid configuration", "[cli]") {
    TempDir dir("config");
    writePly(dir.path() / "quad.ply", "4 0 1 2 3\n", 1);
    auto opts = quietOptions(dir, "quad.ply");
    opts.gridSize = 0;

    REQUIRE(app::runCli(opts) == 1);

    const auto report = readReport(dir);
    REQUIRE(report["failure"]["stage"] == "Idle");
    REQUIRE(report["failure"]["code"] == "InvalidConfig");
}

TEST_CASE("CLI dry run validates without writing", "[cli]") {
    TempDir dir("dry");
    writePly(dir.path() / "broken.ply", "3 0 1 9\n", 1);
    auto opts = quietOptions(dir, "broken.ply");
    opts.dryRun = true;

    REQUIRE(app::runCli(opts) == 1);
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "out" / "report.json"));

    writePly(dir.path() / "quad.ply", "4 0 1 2 3\n", 1);
    opts.inputFile = (dir.path() / "quad.ply").string();
    REQUIRE(app::runCli(opts) == 0);
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "out" / "report.json"));
}
