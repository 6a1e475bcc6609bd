#include "io.hpp"
#include "utils.hpp" // Access to globalLogger
#include "spectra/lineshapes.hpp"
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace specfact {

std::string CsvIO::trimQuotes(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r\f\v\"");
    if (std::string::npos == first) return "";
    size_t last = str.find_last_not_of(" \t\n\r\f\v\"");
    return str.substr(first, (last - first + 1));
}

std::vector<std::string> CsvIO::parseCsvLine(const std::string& line, const std::string& delimiter) {
    std::vector<std::string> cells;
    if (line.empty()) return cells;

    std::string currentCell;
    const char delimChar = delimiter.empty() ? ',' : delimiter[0];
    const char quoteChar = '"';
    bool inQuotes = false;

    for (size_t i = 0; i < line.length(); ++i) {
        char c = line[i];
        if (inQuotes) {
            if (c == quoteChar) {
                // "" inside quotes is a literal quote
                if (i + 1 < line.length() && line[i + 1] == quoteChar) {
                    currentCell += quoteChar;
                    i++;
                } else {
                    inQuotes = false;
                }
            } else {
                currentCell += c;
            }
        } else {
            if (c == quoteChar && currentCell.empty()) {
                inQuotes = true;
            } else if (c == delimChar) {
                cells.push_back(currentCell);
                currentCell.clear();
            } else if (c != '\r') {
                currentCell += c;
            }
        }
    }

    cells.push_back(currentCell);
    return cells;
}

std::string CsvIO::quoteCell(const std::string& cell, const std::string& delimiter) {
    bool needsQuotes = cell.find(delimiter) != std::string::npos ||
                       cell.find('"') != std::string::npos ||
                       cell.find_first_of(" \t\n\r") != std::string::npos;
    if (!needsQuotes) return cell;

    std::string quoted;
    quoted.reserve(cell.size() + 2);
    quoted += '"';
    for (char c : cell) {
        if (c == '"') quoted += "\"\"";
        else quoted += c;
    }
    quoted += '"';
    return quoted;
}

const std::vector<std::string>& CsvIO::peakColumns() {
    static const std::vector<std::string> columns = {
        "modality", "x", "y", "label", "multiplicity", "coupling", "atom_ids"
    };
    return columns;
}

namespace {

bool isColumnIndex(const std::string& column) {
    return !column.empty() &&
           std::all_of(column.begin(), column.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

CsvIO::CsvIO(const std::string& inputPath, const std::string& outputPath,
             const std::string& delimiter, const std::string& smilesColumn, bool hasHeaders)
    : inputPath(inputPath), outputPath(outputPath), delimiter(delimiter),
      smilesColumn(smilesColumn), hasHeaders(hasHeaders) {

    std::ifstream file(inputPath);
    if (!file.is_open()) {
        throw SpectrumException("CsvIO: cannot open input file " + inputPath, ErrorCode::IO_ERROR);
    }

    if (!hasHeaders) {
        smilesIndex = isColumnIndex(smilesColumn) ? std::stoi(smilesColumn) : 0;
        globalLogger.info("CsvIO: no header, descriptors read from column " + std::to_string(smilesIndex));
        return;
    }
    if (!parseHeader(file)) {
        throw SpectrumException("CsvIO: column '" + smilesColumn + "' not found in header of " + inputPath,
                                ErrorCode::PARSE_ERROR);
    }
}

bool CsvIO::parseHeader(std::ifstream& file) {
    std::string headerLine;
    if (!std::getline(file, headerLine)) {
        globalLogger.error("CsvIO: " + inputPath + " has no header line");
        return false;
    }
    if (headerLine.rfind("\xEF\xBB\xBF", 0) == 0) {
        headerLine.erase(0, 3);
    }

    headerColumns = parseCsvLine(headerLine, delimiter);
    for (auto& column : headerColumns) {
        column = trimQuotes(column);
    }

    auto named = std::find(headerColumns.begin(), headerColumns.end(), smilesColumn);
    if (named != headerColumns.end()) {
        smilesIndex = static_cast<int>(named - headerColumns.begin());
        globalLogger.debug("CsvIO: '" + smilesColumn + "' is column " + std::to_string(smilesIndex));
        return true;
    }
    if (isColumnIndex(smilesColumn)) {
        const int index = std::stoi(smilesColumn);
        if (index < static_cast<int>(headerColumns.size())) {
            smilesIndex = index;
            globalLogger.info("CsvIO: using column " + smilesColumn + " ('" + headerColumns[index] + "')");
            return true;
        }
    }
    return false;
}


// --- LineReader ---
CsvIO::LineReader::LineReader(const std::string& path, bool hasHeader, int descriptorIndex,
                              const std::string& delimiter)
    : buffer(1 << 16), descriptorIndex(descriptorIndex), delimiter(delimiter) {

    stream.rdbuf()->pubsetbuf(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    stream.open(path, std::ios::binary);
    if (!stream.is_open()) {
        throw SpectrumException("LineReader: cannot open " + path, ErrorCode::IO_ERROR);
    }

    std::error_code ec;
    fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        globalLogger.warning("LineReader: size of " + path + " unknown: " + ec.message());
        fileSize = 0;
    }

    dataRows = countDataRows(hasHeader);

    std::string header;
    if (hasHeader && std::getline(stream, header)) {
        bytesConsumed += header.size() + 1;
    }
}

size_t CsvIO::LineReader::countDataRows(bool hasHeader) {
    std::string line;
    if (hasHeader) std::getline(stream, line);

    size_t rows = 0;
    while (std::getline(stream, line)) {
        if (!isBlank(line)) ++rows;
    }
    stream.clear();
    stream.seekg(0, std::ios::beg);
    globalLogger.debug("LineReader: " + std::to_string(rows) + " data rows");
    return rows;
}

bool CsvIO::LineReader::readBatch(RowBatch& batch, size_t batchSize) {
    std::lock_guard<std::mutex> lock(readMutex);
    batch.firstRow = rowsRead;
    batch.descriptors.clear();
    batch.cells.clear();

    std::string line;
    while (batch.size() < batchSize && std::getline(stream, line)) {
        bytesConsumed += line.size() + 1;
        if (isBlank(line)) continue;

        std::vector<std::string> cells = parseCsvLine(line, delimiter);
        if (descriptorIndex < 0 || static_cast<size_t>(descriptorIndex) >= cells.size()) {
            globalLogger.warning("LineReader: no column " + std::to_string(descriptorIndex) +
                                 " in row '" + line.substr(0, 50) + "'");
            continue;
        }
        batch.descriptors.push_back(trimQuotes(cells[descriptorIndex]));
        batch.cells.push_back(std::move(cells));
    }
    rowsRead += batch.size();
    return !batch.empty();
}

double CsvIO::LineReader::getProgress() const {
    if (fileSize == 0) return 1.0;
    return std::min(static_cast<double>(bytesConsumed.load(std::memory_order_relaxed)) / fileSize, 1.0);
}

CsvIO::LineReader CsvIO::createLineReader() const {
    if (smilesIndex < 0) {
        throw SpectrumException("CsvIO: descriptor column unresolved", ErrorCode::PARSE_ERROR);
    }
    return LineReader(inputPath, hasHeaders, smilesIndex, delimiter);
}


// --- ResultWriter ---
CsvIO::ResultWriter::ResultWriter(const std::string& path, const std::string& delimiter,
                                  const std::vector<std::string>& inputColumns)
    : delimiter(delimiter), header(inputColumns) {

    if (header.empty()) {
        header.push_back("SMILES");
    }
    header.insert(header.end(), peakColumns().begin(), peakColumns().end());

    stream.open(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!stream.is_open()) {
        throw SpectrumException("ResultWriter: cannot open " + path, ErrorCode::IO_ERROR);
    }
    globalLogger.info("ResultWriter: writing " + path);
}

namespace {

std::string formatNumber(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string joinAtomIds(const std::vector<int>& atomIds) {
    std::string joined;
    for (int id : atomIds) {
        if (!joined.empty()) joined += ';';
        joined += std::to_string(id);
    }
    return joined;
}

// modality, x, y, label, multiplicity, coupling, atom_ids
std::vector<std::vector<std::string>> peakRows(const SpectrumResult& result) {
    std::vector<std::vector<std::string>> rows;
    std::string modality;

    if (const auto* nmr = std::get_if<NMRSpectrum>(&result)) {
        modality = SpectrumFactory::synthesizerName(Modality::NMR, nmr->nucleus);
        for (const auto& peak : nmr->peaks) {
            rows.push_back({modality, formatNumber(peak.shift, 4), formatNumber(peak.intensity, 4), peak.label,
                            peak.multiplicity, peak.hasCoupling() ? formatNumber(peak.coupling, 2) : "NA",
                            joinAtomIds(peak.atomIds)});
        }
    } else {
        modality = modalityToString(resultModality(result));
        const auto& peaks = std::holds_alternative<IRSpectrum>(result) ? std::get<IRSpectrum>(result).peaks
                                                                      : std::get<UVSpectrum>(result).peaks;
        for (const auto& peak : peaks) {
            rows.push_back({modality, formatNumber(peak.x, 2), formatNumber(peak.y, 4), peak.label,
                            "NA", "NA", "NA"});
        }
    }
    if (rows.empty()) {
        rows.push_back({modality, "NA", "NA", "NA", "NA", "NA", "NA"});
    }
    return rows;
}

} // namespace

void CsvIO::ResultWriter::appendRow(std::string& out, const std::vector<std::string>& prefix,
                                    const std::vector<std::string>& peakCells) const {
    bool first = true;
    for (const auto* part : {&prefix, &peakCells}) {
        for (const auto& cell : *part) {
            if (!first) out += delimiter;
            out += quoteCell(cell, delimiter);
            first = false;
        }
    }
    out += '\n';
}

bool CsvIO::ResultWriter::writeBatch(const RowBatch& batch, const std::vector<SpectrumResult>& results) {
    std::lock_guard<std::mutex> lock(writeMutex);

    if (batch.size() != results.size()) {
        globalLogger.error("ResultWriter: " + std::to_string(batch.size()) + " rows but " +
                           std::to_string(results.size()) + " results");
        return false;
    }

    std::string out;
    if (!headerWritten) {
        appendRow(out, header, {});
        headerWritten = true;
    }
    size_t written = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        for (const auto& cells : peakRows(results[i])) {
            appendRow(out, batch.cells[i], cells);
            ++written;
        }
    }

    stream << out;
    if (!stream.good()) {
        globalLogger.error("ResultWriter: write failed");
        stream.clear();
        return false;
    }
    rowsWritten += written;
    return true;
}

void CsvIO::ResultWriter::flush() {
    stream.flush();
}

CsvIO::ResultWriter CsvIO::createResultWriter() const {
    if (outputPath.empty()) {
        throw SpectrumException("CsvIO: no output path", ErrorCode::IO_ERROR);
    }
    return ResultWriter(outputPath, delimiter, headerColumns);
}


// --- Single spectrum output ---
namespace {

void writeLabeledPeaks(rapidjson::Writer<rapidjson::StringBuffer>& writer, const std::vector<LabeledPeak>& peaks) {
    writer.StartArray();
    for (const auto& peak : peaks) {
        writer.StartObject();
        writer.Key("x"); writer.Double(peak.x);
        writer.Key("y"); writer.Double(peak.y);
        writer.Key("label"); writer.String(peak.label.c_str());
        writer.EndObject();
    }
    writer.EndArray();
}

void writeCurve(rapidjson::Writer<rapidjson::StringBuffer>& writer, const Curve& curve) {
    writer.StartObject();
    writer.Key("x");
    writer.StartArray();
    for (const auto& point : curve) writer.Double(point.x);
    writer.EndArray();
    writer.Key("y");
    writer.StartArray();
    for (const auto& point : curve) writer.Double(point.y);
    writer.EndArray();
    writer.EndObject();
}

} // namespace

std::string spectrumToJson(const std::string& descriptor, const SpectrumResult& result,
                           uint64_t seed, bool includeCurve) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("descriptor"); writer.String(descriptor.c_str());
    writer.Key("modality"); writer.String(modalityToString(resultModality(result)).c_str());
    writer.Key("seed"); writer.Uint64(seed);
    writer.Key("generated"); writer.String(util::getTimeStamp().c_str());

    if (const auto* nmr = std::get_if<NMRSpectrum>(&result)) {
        writer.Key("nucleus"); writer.String(nucleusToString(nmr->nucleus).c_str());
        writer.Key("peaks");
        writer.StartArray();
        for (const auto& peak : nmr->peaks) {
            writer.StartObject();
            writer.Key("shift"); writer.Double(peak.shift);
            writer.Key("intensity"); writer.Double(peak.intensity);
            writer.Key("multiplicity"); writer.String(peak.multiplicity.c_str());
            if (peak.hasCoupling()) {
                writer.Key("coupling"); writer.Double(peak.coupling);
            }
            writer.Key("label"); writer.String(peak.label.c_str());
            writer.Key("atomIds");
            writer.StartArray();
            for (int id : peak.atomIds) writer.Int(id);
            writer.EndArray();
            writer.EndObject();
        }
        writer.EndArray();
    } else {
        const Curve& curve = std::holds_alternative<IRSpectrum>(result) ? std::get<IRSpectrum>(result).curve
                                                                        : std::get<UVSpectrum>(result).curve;
        const auto& peaks = std::holds_alternative<IRSpectrum>(result) ? std::get<IRSpectrum>(result).peaks
                                                                       : std::get<UVSpectrum>(result).peaks;
        writer.Key("peaks");
        writeLabeledPeaks(writer, peaks);
        if (includeCurve) {
            writer.Key("curve");
            writeCurve(writer, curve);
        }
    }
    writer.EndObject();
    return buffer.GetString();
}

void writeJsonFile(const std::string& path, const std::string& json) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw SpectrumException("Failed to open output file: " + path, ErrorCode::IO_ERROR);
    }
    out << json << "\n";
    if (!out.good()) {
        throw SpectrumException("Failed writing output file: " + path, ErrorCode::IO_ERROR);
    }
}

Curve renderNmrEnvelope(const NMRSpectrum& spectrum, size_t numPoints) {
    const bool proton = spectrum.nucleus == Nucleus::H1;
    const double maxShift = proton ? 12.0 : 220.0;
    const double halfWidth = proton ? 0.05 : 1.0;

    Curve curve;
    if (numPoints < 2) return curve;
    curve.reserve(numPoints);
    const double step = maxShift / static_cast<double>(numPoints - 1);
    for (size_t i = 0; i < numPoints; ++i) {
        const double x = step * static_cast<double>(i);
        double y = 0.0;
        for (const auto& peak : spectrum.peaks) {
            y += spectra::lorentzian(x, peak.shift, 2.0 * halfWidth, peak.intensity);
        }
        curve.push_back({x, std::min(y, 1.0)});
    }
    return curve;
}

void writeCurveCsv(const std::string& path, const SpectrumResult& result) {
    Curve curve;
    std::string xName = "x";
    std::string yName = "y";
    switch (resultModality(result)) {
        case Modality::IR:
            curve = std::get<IRSpectrum>(result).curve;
            xName = "wavenumber_cm-1";
            yName = "transmittance_pct";
            break;
        case Modality::UV_VIS:
            curve = std::get<UVSpectrum>(result).curve;
            xName = "wavelength_nm";
            yName = "absorbance";
            break;
        case Modality::NMR:
            curve = renderNmrEnvelope(std::get<NMRSpectrum>(result));
            xName = "shift_ppm";
            yName = "intensity";
            break;
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw SpectrumException("Failed to open curve file: " + path, ErrorCode::IO_ERROR);
    }
    out << xName << "," << yName << "\n";
    for (const auto& point : curve) {
        out << formatNumber(point.x, 4) << "," << formatNumber(point.y, 6) << "\n";
    }
    if (!out.good()) {
        throw SpectrumException("Failed writing curve file: " + path, ErrorCode::IO_ERROR);
    }
}

} // namespace specfact
