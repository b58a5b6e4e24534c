#include "visnir/result_writer.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

namespace VisNir {

bool ResultWriter::appendBlocks(const std::string& path, const std::vector<MetricBlock>& blocks) {
    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        std::cerr << "ResultWriter: cannot open " << path << std::endl;
        return false;
    }

    for (const auto& block : blocks) {
        out << formatRow(block.header) << "\n";
        out << formatRow(block.data) << "\n";
        for (const auto& row : block.image_rows) {
            out << formatRow(row) << "\n";
        }
    }

    out.flush();
    if (!out) {
        std::cerr << "ResultWriter: write to " << path << " failed" << std::endl;
        return false;
    }
    return true;
}

std::string ResultWriter::formatRow(const std::vector<std::string>& fields) {
    std::string row;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) row += '\t';
        row += fields[i];
    }
    return row;
}

std::string ResultWriter::formatNumber(double value) {
    std::ostringstream ss;
    ss.precision(12);
    ss << value;
    return ss.str();
}

std::string ResultWriter::formatList(const std::vector<double>& values) {
    std::string list;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) list += ',';
        list += formatNumber(values[i]);
    }
    return list;
}

} // namespace VisNir
