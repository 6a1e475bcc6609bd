#pragma once

#include "utils.hpp"
#include "spectra.hpp"
#include <string>
#include <vector>
#include <fstream>
#include <atomic>
#include <mutex>

namespace specfact {

// Rows handed out by CsvIO::LineReader. firstRow counts non-blank data rows
// from zero across the whole file.
struct RowBatch {
    size_t firstRow = 0;
    std::vector<std::string> descriptors;
    std::vector<std::vector<std::string>> cells;

    size_t size() const { return descriptors.size(); }
    bool empty() const { return descriptors.empty(); }
};

class CsvIO {
private:
    std::string inputPath;
    std::string outputPath;
    std::string delimiter;
    std::string smilesColumn;
    bool hasHeaders;
    std::vector<std::string> headerColumns;
    int smilesIndex = -1;

    bool parseHeader(std::ifstream& file);

public:
    // smilesColumn is a header name, or a zero-based column index given as digits.
    CsvIO(const std::string& inputPath, const std::string& outputPath,
          const std::string& delimiter, const std::string& smilesColumn = "SMILES",
          bool hasHeaders = true);

    const std::vector<std::string>& getHeaderColumns() const { return headerColumns; }
    int getSmilesIndex() const { return smilesIndex; }

    class LineReader {
    private:
        std::mutex readMutex;
        std::vector<char> buffer;
        std::ifstream stream;
        int descriptorIndex;
        std::string delimiter;
        uintmax_t fileSize = 0;
        std::atomic<size_t> bytesConsumed{0};
        size_t dataRows = 0;
        size_t rowsRead = 0;

        size_t countDataRows(bool hasHeader);

    public:
        LineReader(const std::string& path, bool hasHeader, int descriptorIndex,
                   const std::string& delimiter);

        // Replaces batch with up to batchSize rows. Blank lines are skipped and
        // rows too short to hold the descriptor column are logged and dropped.
        bool readBatch(RowBatch& batch, size_t batchSize);

        size_t getEstimatedLines() const { return dataRows; }
        double getProgress() const;
    };

    LineReader createLineReader() const;

    // One output row per labeled peak: the input row's cells followed by
    // the peak columns. Rows without peaks are written once with NA fields.
    class ResultWriter {
    private:
        std::ofstream stream;
        std::string delimiter;
        std::vector<std::string> header;
        std::mutex writeMutex;
        bool headerWritten = false;
        size_t rowsWritten = 0;

        void appendRow(std::string& out, const std::vector<std::string>& prefix,
                       const std::vector<std::string>& peakCells) const;

    public:
        ResultWriter(const std::string& path, const std::string& delimiter,
                     const std::vector<std::string>& inputColumns);

        bool writeBatch(const RowBatch& batch, const std::vector<SpectrumResult>& results);

        size_t getRowsWritten() const { return rowsWritten; }
        void flush();
    };

    ResultWriter createResultWriter() const;

    static const std::vector<std::string>& peakColumns();

    static std::vector<std::string> parseCsvLine(const std::string& line, const std::string& delimiter);
    static std::string trimQuotes(const std::string& str);
    static std::string quoteCell(const std::string& cell, const std::string& delimiter);
};

// JSON document for a single synthesis: descriptor, modality, seed, peaks
// and (for IR/UV-Vis) the curve.
std::string spectrumToJson(const std::string& descriptor, const SpectrumResult& result,
                           uint64_t seed, bool includeCurve = true);

void writeJsonFile(const std::string& path, const std::string& json);

// Two-column x,y CSV. NMR results are drawn as a Lorentzian envelope.
void writeCurveCsv(const std::string& path, const SpectrumResult& result);

// Display envelope for a peak list: 1H 0-12 ppm, 13C 0-220 ppm, summed
// height clamped to 1.
Curve renderNmrEnvelope(const NMRSpectrum& spectrum, size_t numPoints = 1000);

} // namespace specfact
