#ifndef VISNIR_RESULT_WRITER_HPP
#define VISNIR_RESULT_WRITER_HPP

#include <string>
#include <vector>

namespace VisNir {

/**
 * One block of tabular output: a header row of field names, a data row of
 * values, then any number of image rows ("IMAGE", kind, path).
 */
struct MetricBlock {
    std::vector<std::string> header;
    std::vector<std::string> data;
    std::vector<std::vector<std::string>> image_rows;
};

class ResultWriter {
public:
    // Appends the blocks as tab-separated rows. Returns false if the file cannot be written.
    static bool appendBlocks(const std::string& path, const std::vector<MetricBlock>& blocks);

    static std::string formatRow(const std::vector<std::string>& fields);
    static std::string formatNumber(double value);
    static std::string formatList(const std::vector<double>& values);
};

} // namespace VisNir

#endif // VISNIR_RESULT_WRITER_HPP
