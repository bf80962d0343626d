#ifndef GEOCLUSTER_CSV_IO_HPP
#define GEOCLUSTER_CSV_IO_HPP

#include "geocluster/cluster.hpp"
#include "geocluster/geo_point.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace geocluster {

// Comma-separated rows onto a caller-owned stream. Fields go through
// operator<<, so the stream's precision applies; nothing is quoted.
class CsvWriter {
public:
    explicit CsvWriter(std::ostream& out) : out_(out) {}

    void write_header(const std::vector<std::string>& cols);

    template <typename... Fields>
    void write_row(const Fields&... fields) {
        const char* sep = "";
        ((out_ << sep << fields, sep = ","), ...);
        out_ << '\n';
    }

private:
    std::ostream& out_;
};

/**
 * Reads facility rows "id,latitude,longitude". A first line whose latitude
 * field is not numeric is taken as a header and skipped; blank lines are
 * ignored. An empty id field leaves GeoPoint::id unset.
 * Throws std::runtime_error naming the line on a malformed row.
 */
std::vector<GeoPoint> read_points_csv(std::istream& in);

// Writes "cluster_id,id,latitude,longitude", one row per point.
void write_clusters_csv(std::ostream& out, const std::vector<GeoCluster>& clusters);

}  // namespace geocluster

#endif  // GEOCLUSTER_CSV_IO_HPP
