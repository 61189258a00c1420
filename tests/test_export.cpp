#include "export.h"
#include "parameters.h"
#include "simulation.h"
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <set>
#include <sstream>
#include <string>
#include <vector>



namespace fs = std::filesystem;

// small 4 x 3 field with distinct values in every cell
struct SnapshotFields
{
    std::vector<FP> rho;
    std::vector<FP> u_x;
    std::vector<FP> u_y;

    MacroscopicSnapshot View(const uint32_t step) const
    {
        MacroscopicSnapshot snapshot;
        snapshot.step = step;
        snapshot.rho = &rho;
        snapshot.u_x = &u_x;
        snapshot.u_y = &u_y;
        snapshot.N_X = 4;
        snapshot.N_Y = 3;

        return snapshot;
    }
};

static SnapshotFields MakeFields()
{
    SnapshotFields fields;

    for (int i = 0; i < 12; i++)
    {
        fields.rho.push_back(1.0 + 0.001 * i);
        fields.u_x.push_back(0.01 * i - 0.05);
        fields.u_y.push_back(-0.003 * i + 1.0 / 3.0);
    }

    return fields;
}

static fs::path MakeEmptyDirectory(const std::string& name)
{
    const fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);

    return dir;
}

static std::vector<FP> ReadBinary(const fs::path& path)
{
    std::ifstream file(path, std::ios::binary);
    std::vector<FP> values(fs::file_size(path) / sizeof(FP));
    file.read(reinterpret_cast<char*>(values.data()), values.size() * sizeof(FP));

    return values;
}

static std::set<std::string> ListDirectory(const fs::path& dir)
{
    std::set<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir))
    {
        names.insert(entry.path().filename().string());
    }

    return names;
}

TEST(ExportTest, FieldNames) {
    EXPECT_EQ(SimulationDataToString(Density), "density");
    EXPECT_EQ(SimulationDataToString(Velocity_X), "velocity_x");
    EXPECT_EQ(SimulationDataToString(Velocity_Y), "velocity_y");
    EXPECT_EQ(SimulationDataToString(VelocityMagnitude), "velocity_magnitude");
}

TEST(ExportTest, BinaryFileHoldsRawValuesInRowOrder) {
    const fs::path dir = MakeEmptyDirectory("obstacle_flow_export_binary");
    const SnapshotFields fields = MakeFields();

    ExportSimulationData(fields.View(42), Density, dir.string(), true, false);

    const fs::path path = dir / "density_000000042.bin";
    ASSERT_TRUE(fs::exists(path));
    EXPECT_EQ(fs::file_size(path), 12 * sizeof(FP));
    EXPECT_FALSE(fs::exists(dir / "density_000000042.csv"));

    // bit-exact copy of rho[y * N_X + x]
    EXPECT_EQ(ReadBinary(path), fields.rho);

    fs::remove_all(dir);
}

TEST(ExportTest, CsvHasOneGridRowPerLine) {
    const fs::path dir = MakeEmptyDirectory("obstacle_flow_export_csv");
    const SnapshotFields fields = MakeFields();

    ExportSimulationData(fields.View(7), Velocity_Y, dir.string(), false, true);

    EXPECT_FALSE(fs::exists(dir / "velocity_y_000000007.bin"));

    std::ifstream file(dir / "velocity_y_000000007.csv");
    ASSERT_TRUE(file.good());

    std::string line;
    int y = 0;
    while (std::getline(file, line))
    {
        ASSERT_LT(y, 3);

        std::istringstream row(line);
        std::string cell;
        int x = 0;
        while (std::getline(row, cell, ','))
        {
            ASSERT_LT(x, 4);
            EXPECT_DOUBLE_EQ(std::stod(cell), fields.u_y[y * 4 + x]);
            x++;
        }

        EXPECT_EQ(x, 4);
        y++;
    }

    EXPECT_EQ(y, 3);

    fs::remove_all(dir);
}

TEST(ExportTest, VelocityMagnitudeIsNormOfComponents) {
    const fs::path dir = MakeEmptyDirectory("obstacle_flow_export_u_mag");
    const SnapshotFields fields = MakeFields();

    ExportSimulationData(fields.View(1'000'000), VelocityMagnitude, dir.string(), true);

    const std::vector<FP> u_mag = ReadBinary(dir / "velocity_magnitude_001000000.bin");
    ASSERT_EQ(u_mag.size(), 12u);

    for (std::size_t i = 0; i < u_mag.size(); i++)
    {
        EXPECT_DOUBLE_EQ(u_mag[i], std::hypot(fields.u_x[i], fields.u_y[i]));
    }

    fs::remove_all(dir);
}

TEST(ExportTest, OnlySelectedFieldsAreWritten) {
    const fs::path dir = MakeEmptyDirectory("obstacle_flow_export_selection");
    const SnapshotFields fields = MakeFields();

    SimulationParameters parameters;
    parameters.export_dir = dir.string();
    parameters.export_rho = true;
    parameters.export_u_x = false;
    parameters.export_u_y = true;
    parameters.export_u_mag = false;
    parameters.export_csv = false;

    ExportSelectedData(fields.View(300), parameters);

    const std::set<std::string> expected = {
        "density_000000300.bin",
        "velocity_y_000000300.bin",
    };
    EXPECT_EQ(ListDirectory(dir), expected);

    // with csv enabled every selected field gets both files
    parameters.export_rho = false;
    parameters.export_u_y = false;
    parameters.export_u_mag = true;
    parameters.export_csv = true;

    ExportSelectedData(fields.View(400), parameters);

    EXPECT_TRUE(fs::exists(dir / "velocity_magnitude_000000400.bin"));
    EXPECT_TRUE(fs::exists(dir / "velocity_magnitude_000000400.csv"));
    EXPECT_EQ(ListDirectory(dir).size(), 4u);

    fs::remove_all(dir);
}

TEST(ExportTest, UnusableDirectoryIsSkipped) {
    const fs::path dir = MakeEmptyDirectory("obstacle_flow_export_blocked");
    fs::create_directories(dir);

    // a regular file where the output directory should go
    const fs::path blocker = dir / "not_a_directory";
    std::ofstream(blocker) << "x";

    const SnapshotFields fields = MakeFields();
    EXPECT_NO_THROW(ExportSimulationData(
        fields.View(0), Density, (blocker / "out").string(), true, true));

    EXPECT_EQ(ListDirectory(dir).size(), 1u);

    fs::remove_all(dir);
}
