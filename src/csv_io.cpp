#include "geocluster/csv_io.hpp"

#include <cstdlib>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <utility>

namespace geocluster {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    size_t pos = 0;
    while (true) {
        size_t end = line.find(',', pos);
        if (end == std::string::npos) {
            fields.push_back(trim(line.substr(pos)));
            break;
        }
        fields.push_back(trim(line.substr(pos, end - pos)));
        pos = end + 1;
    }
    return fields;
}

bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return end == s.c_str() + s.size();
}

}  // namespace

std::vector<GeoPoint> read_points_csv(std::istream& in) {
    std::vector<GeoPoint> points;
    std::string line;
    size_t line_no = 0;
    bool first_row = true;

    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;

        bool header_candidate = first_row;
        first_row = false;

        auto fields = split_fields(line);
        if (fields.size() < 3)
            throw std::runtime_error("read_points_csv: line " + std::to_string(line_no) +
                                     ": expected id,latitude,longitude");

        GeoPoint p;
        bool lat_ok = parse_double(fields[1], p.latitude);
        bool lon_ok = parse_double(fields[2], p.longitude);
        if (!lat_ok || !lon_ok) {
            if (header_candidate && !lat_ok) continue;  // header
            throw std::runtime_error("read_points_csv: line " + std::to_string(line_no) +
                                     ": non-numeric coordinate");
        }
        if (!fields[0].empty()) p.id = fields[0];
        points.push_back(std::move(p));
    }
    return points;
}

void CsvWriter::write_header(const std::vector<std::string>& cols) {
    for (size_t i = 0; i < cols.size(); ++i) {
        if (i > 0) out_ << ',';
        out_ << cols[i];
    }
    out_ << '\n';
}

void write_clusters_csv(std::ostream& out, const std::vector<GeoCluster>& clusters) {
    out << std::setprecision(10);
    CsvWriter csv(out);
    csv.write_header({"cluster_id", "id", "latitude", "longitude"});
    for (const auto& c : clusters)
        for (const auto& p : c.points)
            csv.write_row(c.id, p.id.value_or(""), p.latitude, p.longitude);
}

}  // namespace geocluster
