#include "covmap/overlay/kml.hpp"
#include "covmap/core/errors.hpp"
#include "covmap/core/utils.hpp"

#include <fstream>
#include <sstream>

namespace covmap::overlay {

namespace {

constexpr const char* kTargetIcon = "http://maps.google.com/mapfiles/kml/shapes/target.png";

std::string num(double v) { return core::format_number(v); }
std::string coord(double v) { return core::format_exact(v); }

} // namespace

std::string render_kml(const SiteParameters& site, const BoundingBox& bounds,
                       const std::string& image_href) {
    using core::xml_escape;

    const std::string name = xml_escape(site.name);
    const std::string hu = height_unit(site.units);
    const std::string model = std::to_string(propagation_model_to_int(site.model)) + " (" +
                              propagation_model_to_string(site.model) + ")";

    std::ostringstream k;
    k << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      << "<kml xmlns=\"http://www.opengis.net/kml/2.2\">\n"
      << "  <Document>\n"
      << "    <name>" << name << "</name>\n"
      << "    <description>" << xml_escape(site.description) << "</description>\n"
      << "\n"
      << "    <GroundOverlay>\n"
      << "      <name>" << name << " Coverage</name>\n"
      << "      <description>\n"
      << "        Frequency: " << num(site.frequency_mhz) << " MHz\n"
      << "        ERP: " << coord(site.erp_watts) << " W\n"
      << "        TX Height: " << num(site.tx_height) << " " << hu << "\n"
      << "        Radius: " << num(site.radius) << " " << distance_unit(site.units) << "\n"
      << "        Threshold: " << num(site.rx_threshold) << " "
      << xml_escape(output_unit_to_string(site.output_unit)) << "\n"
      << "        Model: " << xml_escape(model) << "\n"
      << "        Resolution: " << site.resolution << " ppd\n"
      << "      </description>\n"
      << "      <Icon>\n"
      << "        <href>" << xml_escape(image_href) << "</href>\n"
      << "      </Icon>\n"
      << "      <LatLonBox>\n"
      << "        <north>" << coord(bounds.north) << "</north>\n"
      << "        <south>" << coord(bounds.south) << "</south>\n"
      << "        <east>" << coord(bounds.east) << "</east>\n"
      << "        <west>" << coord(bounds.west) << "</west>\n"
      << "      </LatLonBox>\n"
      << "    </GroundOverlay>\n"
      << "\n"
      << "    <Placemark>\n"
      << "      <name>" << name << " TX</name>\n"
      << "      <description>\n"
      << "        Transmitter Location\n"
      << "        Lat: " << coord(site.tx_lat) << "\n"
      << "        Lon: " << coord(site.tx_lon) << "\n"
      << "        Height: " << num(site.tx_height) << " " << hu << " AGL\n"
      << "        Frequency: " << num(site.frequency_mhz) << " MHz\n"
      << "        ERP: " << coord(site.erp_watts) << " W\n"
      << "      </description>\n"
      << "      <Style>\n"
      << "        <IconStyle>\n"
      << "          <Icon>\n"
      << "            <href>" << kTargetIcon << "</href>\n"
      << "          </Icon>\n"
      << "        </IconStyle>\n"
      << "      </Style>\n"
      << "      <Point>\n"
      << "        <coordinates>" << coord(site.tx_lon) << "," << coord(site.tx_lat)
      << ",0</coordinates>\n"
      << "      </Point>\n"
      << "    </Placemark>\n"
      << "  </Document>\n"
      << "</kml>\n";
    return k.str();
}

fs::path write_kml(const fs::path& output_dir, const SiteParameters& site,
                   const BoundingBox& bounds) {
    const fs::path path = output_dir / (site.name + ".kml");
    const std::string text = render_kml(site, bounds, site.name + ".png");

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw DescriptorWriteFailed("cannot open " + path.string());
    }
    out << text;
    out.close();
    if (!out) {
        throw DescriptorWriteFailed("cannot write " + path.string());
    }
    return path;
}

} // namespace covmap::overlay
