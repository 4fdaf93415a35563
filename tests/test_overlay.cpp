#include "covmap/core/errors.hpp"
#include "covmap/core/utils.hpp"
#include "covmap/engine/process.hpp"
#include "covmap/geo/bounds.hpp"
#include "covmap/overlay/kml.hpp"
#include "covmap/overlay/manifest.hpp"
#include "covmap/overlay/packager.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <sstream>

using Catch::Approx;
using namespace covmap;
using covmap::testing::TempDir;

namespace fs = std::filesystem;

namespace {

SiteParameters reference_site() {
  SiteParameters s;
  s.name = "TESTSITE";
  s.description = "Ridge & Valley <test>";
  s.tx_lat = 40.264444;
  s.tx_lon = -76.883611;
  s.tx_height = 30.0;
  s.frequency_mhz = 906.875;
  s.power_watts = 50.0;
  s.antenna_gain_dbi = 3.0;
  s.erp_watts = 99.763116;
  s.rx_height = 2.0;
  s.rx_threshold = -100.0;
  s.radius = 100.0;
  s.resolution = 1200;
  return s;
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("kml_describes_overlay_and_transmitter") {
  const SiteParameters site = reference_site();
  const BoundingBox b = geo::compute_bounds(site.tx_lat, site.tx_lon, site.radius, site.units);
  const std::string kml = overlay::render_kml(site, b, "TESTSITE.png");

  REQUIRE(core::starts_with(kml, "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"));
  REQUIRE(contains(kml, "<kml xmlns=\"http://www.opengis.net/kml/2.2\">"));
  REQUIRE(contains(kml, "<name>TESTSITE</name>"));
  REQUIRE(contains(kml, "<description>Ridge &amp; Valley &lt;test&gt;</description>"));
  REQUIRE(contains(kml, "<href>TESTSITE.png</href>"));
  REQUIRE(contains(kml, "<north>" + core::format_exact(b.north) + "</north>"));
  REQUIRE(contains(kml, "<south>" + core::format_exact(b.south) + "</south>"));
  REQUIRE(contains(kml, "<east>" + core::format_exact(b.east) + "</east>"));
  REQUIRE(contains(kml, "<west>" + core::format_exact(b.west) + "</west>"));
  REQUIRE(contains(kml, "<coordinates>-76.883611,40.264444,0</coordinates>"));
  REQUIRE(contains(kml, "Frequency: 906.875 MHz"));
  REQUIRE(contains(kml, "ERP: 99.763116 W"));
  REQUIRE(contains(kml, "TX Height: 30 m"));
  REQUIRE(contains(kml, "Radius: 100 km"));
  REQUIRE(contains(kml, "Threshold: -100 dBm"));
  REQUIRE(contains(kml, "Model: 1 (ITM)"));
  REQUIRE(contains(kml, "Resolution: 1200 ppd"));
  REQUIRE(contains(kml, "kml/shapes/target.png"));
  REQUIRE(core::ends_with(kml, "</kml>\n"));
}

TEST_CASE("kml_marker_sits_on_exact_transmitter_point") {
  SiteParameters site = reference_site();
  site.tx_lat = 40.2644447777;
  site.tx_lon = -76.8836119999;
  const std::string kml = overlay::render_kml(site, BoundingBox{}, "TESTSITE.png");
  REQUIRE(contains(kml, "<coordinates>-76.8836119999,40.2644447777,0</coordinates>"));
}

TEST_CASE("kml_uses_imperial_units_when_selected") {
  SiteParameters site = reference_site();
  site.units = UnitSystem::IMPERIAL;
  site.output_unit = OutputUnit::FIELD_STRENGTH_DBUV;
  const std::string kml = overlay::render_kml(site, BoundingBox{}, "TESTSITE.png");
  REQUIRE(contains(kml, "TX Height: 30 ft"));
  REQUIRE(contains(kml, "Height: 30 ft AGL"));
  REQUIRE(contains(kml, "Radius: 100 mi"));
  REQUIRE(contains(kml, "Threshold: -100 dBuV/m"));
}

TEST_CASE("write_kml_fails_for_missing_directory") {
  TempDir tmp("covmap_overlay");
  REQUIRE_THROWS_AS(overlay::write_kml(tmp.path() / "no" / "such", reference_site(), BoundingBox{}),
                    DescriptorWriteFailed);
}

TEST_CASE("manifest_lists_site_and_overlay_bounds") {
  SiteParameters site = reference_site();
  const BoundingBox b{41.0, 39.0, -75.0, -78.0};
  const auto m = overlay::build_manifest(site, b, "/potential/TESTSITE/TESTSITE.png");

  REQUIRE(m["site"]["name"] == "TESTSITE");
  REQUIRE(m["site"]["lat"].get<double>() == Approx(40.264444));
  REQUIRE(m["site"]["lon"].get<double>() == Approx(-76.883611));
  REQUIRE(m["site"]["antenna_agl_m"].get<double>() == Approx(30.0));
  REQUIRE(m["overlays"].size() == 1);
  const auto &ov = m["overlays"][0];
  REQUIRE(ov["name"] == "TESTSITE");
  REQUIRE(ov["image"] == "/potential/TESTSITE/TESTSITE.png");
  REQUIRE(ov["bounds"][0][0].get<double>() == Approx(39.0));
  REQUIRE(ov["bounds"][0][1].get<double>() == Approx(-78.0));
  REQUIRE(ov["bounds"][1][0].get<double>() == Approx(41.0));
  REQUIRE(ov["bounds"][1][1].get<double>() == Approx(-75.0));
  REQUIRE(ov["rotation"].is_null());

  site.units = UnitSystem::IMPERIAL;
  site.tx_height = 100.0;
  const auto mi = overlay::build_manifest(site, b, "TESTSITE.png");
  REQUIRE(mi["site"]["antenna_agl_m"].get<double>() == Approx(30.48));
}

TEST_CASE("manifest_index_collects_every_site_once") {
  TempDir tmp("covmap_overlay");
  const fs::path index = overlay::update_manifest_index(tmp.path(), "/potential/RIDGE.manifest.json");
  REQUIRE(index == tmp.path() / "index.json");
  overlay::update_manifest_index(tmp.path(), "/potential/HILLTOP.manifest.json");
  overlay::update_manifest_index(tmp.path(), "/potential/RIDGE.manifest.json");

  const auto parsed = nlohmann::json::parse(core::read_text(index));
  REQUIRE(parsed["manifests"] == nlohmann::json::array({"/potential/HILLTOP.manifest.json",
                                                        "/potential/RIDGE.manifest.json"}));

  core::write_text(index, "{\"manifests\": 3}");
  REQUIRE_THROWS_AS(overlay::update_manifest_index(tmp.path(), "X.manifest.json"),
                    DescriptorWriteFailed);
}

TEST_CASE("kmz_round_trip_holds_exactly_kml_and_png") {
  if (!covmap::testing::has_tool("zip") || !covmap::testing::has_tool("unzip")) {
    SKIP("zip/unzip not available");
  }
  TempDir tmp("covmap_overlay");
  const SiteParameters site = reference_site();
  const fs::path kml = overlay::write_kml(tmp.path(), site, BoundingBox{41.0, 39.0, -75.0, -78.0});
  const fs::path png = tmp.path() / "TESTSITE.png";
  cv::Mat image(3, 5, CV_8UC4, cv::Scalar(10, 200, 30, 255));
  image.at<cv::Vec4b>(1, 2) = cv::Vec4b(0, 0, 0, 0);
  REQUIRE(cv::imwrite(png.string(), image));
  core::write_text(tmp.path() / "unrelated.txt", "keep me out");

  std::ostringstream diag;
  const fs::path kmz = overlay::create_kmz(tmp.path(), site.name, "zip", diag);
  REQUIRE(kmz == tmp.path() / "TESTSITE.kmz");

  const auto unzip = *core::find_in_path("unzip");
  std::vector<std::string> entries;
  const auto list = engine::run_process(unzip, {"-Z1", kmz.string()}, tmp.path(),
                                        [&entries](const std::string &line) {
                                          entries.push_back(line);
                                        });
  REQUIRE(list.ok());
  std::sort(entries.begin(), entries.end());
  REQUIRE(entries == std::vector<std::string>{"TESTSITE.kml", "TESTSITE.png"});

  const fs::path extracted = tmp.path() / "extracted";
  const auto unpack = engine::run_process(unzip, {"-o", kmz.string(), "-d", extracted.string()},
                                          tmp.path(), [](const std::string &) {});
  REQUIRE(unpack.ok());
  REQUIRE(core::read_bytes(extracted / "TESTSITE.kml") == core::read_bytes(kml));
  REQUIRE(core::read_bytes(extracted / "TESTSITE.png") == core::read_bytes(png));
  REQUIRE_FALSE(fs::exists(extracted / "unrelated.txt"));

  // A second build replaces the archive instead of appending to it.
  image.setTo(cv::Scalar(255, 255, 255, 0));
  REQUIRE(cv::imwrite(png.string(), image));
  overlay::create_kmz(tmp.path(), site.name, "zip", diag);
  entries.clear();
  engine::run_process(unzip, {"-Z1", kmz.string()}, tmp.path(),
                      [&entries](const std::string &line) { entries.push_back(line); });
  REQUIRE(entries.size() == 2);

  const fs::path again = tmp.path() / "again";
  REQUIRE(engine::run_process(unzip, {"-o", kmz.string(), "-d", again.string()}, tmp.path(),
                              [](const std::string &) {})
              .ok());
  REQUIRE(core::read_bytes(again / "TESTSITE.png") == core::read_bytes(png));
}

TEST_CASE("kmz_requires_both_members_and_a_zip_tool") {
  TempDir tmp("covmap_overlay");
  std::ostringstream diag;
  REQUIRE_THROWS_AS(overlay::create_kmz(tmp.path(), "TESTSITE", "zip", diag), PackagingFailed);

  core::write_text(tmp.path() / "TESTSITE.kml", "<kml/>");
  core::write_text(tmp.path() / "TESTSITE.png", "png");
  REQUIRE_THROWS_AS(overlay::create_kmz(tmp.path(), "TESTSITE", "/nonexistent/zip", diag),
                    PackagingFailed);
  REQUIRE_FALSE(fs::exists(tmp.path() / "TESTSITE.kmz"));
}
