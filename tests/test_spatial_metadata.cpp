// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include "datadem/errors.hpp"
#include "datadem/metadata/spatial_metadata.hpp"
#include "datadem/metadata/work_queue.hpp"

namespace fs = std::filesystem;
using namespace datadem;

// ─── WorkQueue ──────────────────────────────────────────────────────────────

TEST(WorkQueueTest, FifoAndPending) {
  WorkQueue<int> queue;
  queue.push(1);
  queue.push(2);
  EXPECT_EQ(queue.pending(), 2u);

  auto a = queue.pop();
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(*a, 1);
  queue.taskDone();
  EXPECT_EQ(queue.pending(), 1u);

  EXPECT_EQ(*queue.pop(), 2);
  queue.taskDone();
  queue.join();  // Returns immediately once drained
  EXPECT_EQ(queue.pending(), 0u);
}

TEST(WorkQueueTest, CloseReleasesConsumers) {
  WorkQueue<int> queue;
  queue.close();
  EXPECT_FALSE(queue.pop().has_value());
}

TEST(WorkQueueTest, WorkerPoolDrainsQueue) {
  WorkQueue<int> queue;
  std::atomic<int> sum{0};
  std::atomic<int> handled{0};

  std::vector<std::thread> pool;
  for (int i = 0; i < 4; ++i) {
    pool.emplace_back([&] {
      while (auto item = queue.pop()) {
        sum += *item;
        ++handled;
        queue.taskDone();
      }
    });
  }
  for (int i = 1; i <= 100; ++i) queue.push(i);
  queue.join();
  EXPECT_EQ(handled.load(), 100);
  EXPECT_EQ(sum.load(), 5050);

  queue.close();
  for (auto& t : pool) t.join();
}

// ─── Attributes ─────────────────────────────────────────────────────────────

TEST(MetadataValuesTest, FieldNames) {
  auto names = metadataFieldNames();
  ASSERT_EQ(names.size(), 8u);
  EXPECT_EQ(names.front(), "Name");
  EXPECT_EQ(names.back(), "URL");
}

TEST(MetadataValuesTest, FullMetadataIsUsed) {
  EntryInfo info;
  info.metadata = {"Survey", "NOAA", "2019", "multibeam",
                   "1m",     "WGS84", "MLLW", "http://example.org"};
  EXPECT_EQ(metadataValues(info, "ignored"), info.metadata);
}

TEST(MetadataValuesTest, PartialMetadataFallsBack) {
  EntryInfo info;
  info.metadata = {"Survey", "NOAA"};
  auto values = metadataValues(info, "ncei");
  ASSERT_EQ(values.size(), 8u);
  EXPECT_EQ(values[0], "ncei");
  EXPECT_EQ(values[1], "Unknown");
  EXPECT_EQ(values[2], "0");
  EXPECT_EQ(values[3], "xyz_elevation");
  EXPECT_EQ(values[5], "WGS84");
  EXPECT_EQ(values[6], "NAVD88");
}

// ─── Polygonize ─────────────────────────────────────────────────────────────

TEST(PolygonizeTest, EmptyMask) {
  Raster mask(GridSpec::fromRegion(Region(0, 4, 0, 4), 1.0));
  mask.data().setZero();
  EXPECT_TRUE(polygonize(mask).empty());
  EXPECT_EQ(toWkt(polygonize(mask)), "MULTIPOLYGON EMPTY");
}

TEST(PolygonizeTest, BlockBecomesOneRectangle) {
  Raster mask(GridSpec::fromRegion(Region(0, 4, 0, 4), 1.0));
  mask.data().setZero();
  // Rows 1-2, cols 1-2: x 1..3, y 1..3
  mask.data().block(1, 1, 2, 2).setOnes();

  auto footprint = polygonize(mask);
  ASSERT_EQ(footprint.size(), 1u);
  ASSERT_EQ(footprint[0].size(), 1u);
  const auto& ring = footprint[0][0];
  ASSERT_EQ(ring.size(), 5u);
  EXPECT_EQ(ring.front(), ring.back());
  EXPECT_DOUBLE_EQ(ring[0].first, 1.0);
  EXPECT_DOUBLE_EQ(ring[0].second, 1.0);
  EXPECT_DOUBLE_EQ(ring[2].first, 3.0);
  EXPECT_DOUBLE_EQ(ring[2].second, 3.0);
}

TEST(PolygonizeTest, DifferentRunsSplit) {
  Raster mask(GridSpec::fromRegion(Region(0, 4, 0, 2), 1.0));
  mask.data().setZero();
  mask(0, 0) = 1.0f;
  mask(0, 1) = 1.0f;
  mask(1, 0) = 1.0f;
  mask(1, 3) = mask.nodata();

  EXPECT_EQ(polygonize(mask).size(), 2u);
}

TEST(PolygonizeTest, WktText) {
  MultiPolygon mp = {Polygon{Ring{{0, 0}, {1, 0}, {1, 1}, {0, 0}}}};
  EXPECT_EQ(toWkt(mp), "MULTIPOLYGON (((0 0, 1 0, 1 1, 0 0)))");
}

// ─── SpatialMetadata ────────────────────────────────────────────────────────

class SpatialMetadataTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir = fs::temp_directory_path() / "datadem_spatial_metadata";
    fs::remove_all(dir);
    fs::create_directories(dir);

    write("sa/a.xyz", "1.5 1.5 -1\n2.5 1.5 -2\n");
    write("sa/a.datalist", "a.xyz\n");
    write("sb/b.xyz", "7.5 7.5 -3\n");
    write("sb/b.datalist", "b.xyz\n");
    write("far/far.xyz", "50 50 -4\n");
    write("far/far.datalist", "far.xyz\n");
    write("c.xyz", "5 5 -5\n");
    root = write("root.datalist",
                 "sa/a.datalist -1 1 "
                 "SurveyA,NOAA,2019,multibeam,1m,WGS84,MLLW,http://x\n"
                 "sb/b.datalist\n"
                 "c.xyz\n"
                 "far/far.datalist\n");
  }

  void TearDown() override { fs::remove_all(dir); }

  std::string write(const std::string& name, const std::string& content) {
    const auto path = dir / name;
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path);
    ofs << content;
    return path.string();
  }

  fs::path dir;
  std::string root;
};

TEST_F(SpatialMetadataTest, OneFootprintPerSubCatalog) {
  CatalogResolver resolver(config::Xyz{}, config::Catalog{});
  config::Metadata cfg;
  cfg.workers = 2;
  cfg.min_increment = 0.0;

  MemoryLayer layer(metadataFieldNames());
  SpatialMetadata metadata(cfg, resolver);
  const size_t n = metadata.run(root, Region(0, 10, 0, 10), 1.0, layer);

  // Loose files are not footprinted; far/ has no data in the region
  EXPECT_EQ(n, 2u);
  ASSERT_EQ(layer.size(), 2u);

  const Feature* a = nullptr;
  const Feature* b = nullptr;
  for (const auto& f : layer.features()) {
    if (f.attributes.at("Name") == "SurveyA") a = &f;
    if (f.attributes.at("Name") == "b") b = &f;
  }
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);

  EXPECT_EQ(a->attributes.at("Agency"), "NOAA");
  EXPECT_EQ(a->attributes.at("VDatum"), "MLLW");
  ASSERT_EQ(a->geometry.size(), 1u);
  EXPECT_DOUBLE_EQ(a->geometry[0][0][0].first, 1.0);
  EXPECT_DOUBLE_EQ(a->geometry[0][0][2].first, 3.0);

  EXPECT_EQ(b->attributes.at("Agency"), "Unknown");
  EXPECT_EQ(b->attributes.at("VDatum"), "NAVD88");
}

TEST_F(SpatialMetadataTest, WritesTextLayer) {
  CatalogResolver resolver(config::Xyz{}, config::Catalog{});
  config::Metadata cfg;
  cfg.workers = 1;

  const auto path = (dir / "out_sm.tsv").string();
  {
    WktTextLayer layer(path, metadataFieldNames());
    SpatialMetadata(cfg, resolver).run(root, Region(0, 10, 0, 10), 1.0, layer);
    EXPECT_EQ(layer.size(), 2u);
  }

  std::ifstream in(path);
  std::string header;
  std::getline(in, header);
  EXPECT_EQ(header.rfind("Name\tAgency\t", 0), 0u);
  EXPECT_NE(header.find("geometry"), std::string::npos);

  size_t lines = 0;
  std::string line;
  while (std::getline(in, line)) {
    EXPECT_NE(line.find("MULTIPOLYGON"), std::string::npos);
    ++lines;
  }
  EXPECT_EQ(lines, 2u);
}

TEST_F(SpatialMetadataTest, DegenerateRegionThrows) {
  CatalogResolver resolver(config::Xyz{}, config::Catalog{});
  MemoryLayer layer(metadataFieldNames());
  SpatialMetadata metadata(config::Metadata{}, resolver);
  EXPECT_THROW(metadata.run(root, Region(5, 5, 0, 10), 1.0, layer),
               InvalidRegion);
}

TEST(WktTextLayerTest, UncreatableFileThrows) {
  EXPECT_THROW(WktTextLayer("/nonexistent_dir/x.tsv", metadataFieldNames()),
               ExternalToolFailure);
}
