#include "common.hpp"

#ifndef DISTANCE_MATRIX_HPP
#define DISTANCE_MATRIX_HPP

namespace distance_matrix {

using namespace std;

ChangeLog logDistanceMatrix("DistanceMatrix",
    "2026-10-02", "fpc authors", "Dense square storage with item names", "minor",
    "2026-10-06", "fpc authors", "Validation of symmetry, sign and diagonal", "patch",
    "2026-10-16", "fpc authors", "Reject item counts whose matrix cannot be stored", "patch");

class DistanceMatrix {
    size_t n;
    vector<double> entries;
    vector<string> names;

    static size_t checkedEntryCount(size_t n) {
        if (n != 0 && n > vector<double>().max_size() / n) {
            cerr << "Error: A distance matrix of " << n << " items is too large!\n";
            throw invalid_argument("Distance matrix too large");
        }
        return n * n;
    }

public:
    DistanceMatrix(size_t n = 0) : n(n), entries(checkedEntryCount(n), 0), names(n) {
        for (size_t i = 0; i < n; i++) names[i] = to_string(i);
    }

    DistanceMatrix(vector<vector<double> > const& rows) : DistanceMatrix(rows.size()) {
        for (size_t i = 0; i < n; i++) {
            if (rows[i].size() != n) {
                cerr << "Error: Row " << i << " has " << rows[i].size() << " entries but the matrix has " << n << " rows!\n";
                throw invalid_argument("Distance matrix is not square");
            }
            copy(rows[i].begin(), rows[i].end(), entries.begin() + i * n);
        }
    }

    size_t size() const noexcept { return n; }

    double const* operator[](size_t i) const noexcept { return entries.data() + i * n; }

    double* operator[](size_t i) noexcept { return entries.data() + i * n; }

    double at(size_t i, size_t j) const {
        if (i >= n || j >= n) {
            cerr << "Error: Entry (" << i << "," << j << ") is out of range for a matrix of " << n << " items!\n";
            throw out_of_range("Distance matrix index out of range");
        }
        return entries[i * n + j];
    }

    // Sets both (i, j) and (j, i).
    void set(size_t i, size_t j, double d) {
        at(i, j);
        entries[i * n + j] = d;
        entries[j * n + i] = d;
    }

    string const& name(size_t i) const { return names.at(i); }

    void setName(size_t i, string const& name) { names.at(i) = name; }

    optional<pair<size_t, size_t> > firstAsymmetry(double tolerance = 0) const noexcept {
        for (size_t i = 0; i < n; i++) {
            for (size_t j = i + 1; j < n; j++) {
                if (!(fabs(entries[i * n + j] - entries[j * n + i]) <= tolerance)) return make_pair(i, j);
            }
        }
        return nullopt;
    }

    optional<pair<size_t, size_t> > firstNegative() const noexcept {
        for (size_t i = 0; i < n; i++) {
            for (size_t j = 0; j < n; j++) {
                if (!(entries[i * n + j] >= 0)) return make_pair(i, j);
            }
        }
        return nullopt;
    }

    optional<size_t> firstNonZeroDiagonal() const noexcept {
        for (size_t i = 0; i < n; i++) {
            if (entries[i * n + i] != 0) return i;
        }
        return nullopt;
    }

    bool isSymmetric(double tolerance = 0) const noexcept { return !firstAsymmetry(tolerance); }

    bool isNonNegative() const noexcept { return !firstNegative(); }

    bool hasZeroDiagonal() const noexcept { return !firstNonZeroDiagonal(); }

    void validate(double symmetryTolerance = 0) const {
        if (auto d = firstNonZeroDiagonal()) {
            cerr << "Error: Distance of " << names[*d] << " to itself is " << entries[*d * n + *d] << " instead of 0!\n";
            throw invalid_argument("Non-zero diagonal");
        }
        if (auto p = firstNegative()) {
            cerr << "Error: Distance between " << names[p->first] << " and " << names[p->second] << " is negative or not a number: " << entries[p->first * n + p->second] << "\n";
            throw invalid_argument("Negative distance");
        }
        if (auto p = firstAsymmetry(symmetryTolerance)) {
            cerr << "Error: Distance matrix is not symmetric: D(" << names[p->first] << "," << names[p->second] << ") = " << entries[p->first * n + p->second]
                << " but D(" << names[p->second] << "," << names[p->first] << ") = " << entries[p->second * n + p->first] << "\n";
            throw invalid_argument("Asymmetric distance matrix");
        }
    }
};

ChangeLog logDistanceMatrixParser("DistanceMatrixParser",
    "2026-10-04", "fpc authors", "PHYLIP square and lower-triangular distance matrices", "minor",
    "2026-10-11", "fpc authors", "Strip carriage returns with a warning", "patch",
    "2026-10-16", "fpc authors", "Read all rows before allocating the matrix", "patch");

/*
 * PHYLIP distance matrix:
 *   n
 *   name_0 d_00 d_01 ... d_0(n-1)      (square)
 *   name_i d_i0 ... d_i(i-1)           (strict lower triangle)
 *   name_i d_i0 ... d_ii               (lower triangle with diagonal)
 * Each row is on a single line; the layout is decided by the first row.
 */
class DistanceMatrixParser : common::LogInfo {
public:
    enum class Layout { UNKNOWN, SQUARE, LOWER, LOWER_WITH_DIAGONAL };

private:
    Layout layout = Layout::UNKNOWN;
    size_t lineNumber = 0;

    string nextLine(istream& in) {
        string line;
        while (getline(in, line)) {
            lineNumber++;
            size_t len = line.length();
            if (len > 0 && line[len - 1] == '\r') {
                line = line.substr(0, len - 1);
                LogInfo vlog(verbose + 1);
                vlog << "Warning: Carriage return (\\r) detected on line " << lineNumber << ". Removed.\n";
            }
            if (line.find_first_not_of(" \t") != string::npos) return line;
        }
        return "";
    }

    static vector<string> tokenize(const string& line) {
        vector<string> res;
        istringstream sin(line);
        string token;
        while (sin >> token) res.push_back(token);
        return res;
    }

    static bool seemsPhylipHeader(const string& line) {
        size_t i = 0;
        while (i < line.length() && (line[i] == ' ' || line[i] == '\t')) i++;
        if (i == line.length() || line[i] < '0' || line[i] > '9') return false;
        while (i < line.length() && line[i] >= '0' && line[i] <= '9') i++;
        while (i < line.length() && (line[i] == ' ' || line[i] == '\t')) i++;
        return i == line.length();
    }

    static double parseDistance(const string& token, const string& name, size_t line) {
        size_t pos = 0;
        double d = 0;
        try {
            d = stod(token, &pos);
        }
        catch (const logic_error&) {
            pos = 0;
        }
        if (pos != token.length()) {
            cerr << "Error: Invalid distance '" << token << "' in row of " << name << " on line " << line << ".\n";
            throw invalid_argument("Invalid distance value");
        }
        return d;
    }

    Layout decideLayout(size_t nValues, size_t n) const {
        if (nValues == n) return Layout::SQUARE;
        if (nValues == 0) return Layout::LOWER;
        if (nValues == 1) return Layout::LOWER_WITH_DIAGONAL;
        cerr << "Error: First row on line " << lineNumber << " has " << nValues << " distances; expected " << n << " (square), 0 or 1 (lower triangle).\n";
        throw invalid_argument("Unknown distance matrix layout");
    }

    size_t expectedValues(size_t i, size_t n) const noexcept {
        switch (layout) {
        case Layout::SQUARE: return n;
        case Layout::LOWER: return i;
        default: return i + 1;
        }
    }

public:
    DistanceMatrixParser(int verbose = common::LogInfo::DEFAULT_VERBOSE) : LogInfo(verbose) {}

    Layout getLayout() const noexcept { return layout; }

    DistanceMatrix parse(istream& in) {
        layout = Layout::UNKNOWN;
        lineNumber = 0;
        string header = nextLine(in);
        if (header.length() == 0) {
            cerr << "Error: Distance matrix input seems empty!\n";
            throw invalid_argument("Empty input");
        }
        if (!seemsPhylipHeader(header)) {
            cerr << "Error: Expected the number of items on line " << lineNumber << " but found '" << header << "'.\n";
            throw invalid_argument("PHYLIP header error");
        }
        size_t n;
        try {
            n = stoull(header);
        }
        catch (const out_of_range&) {
            cerr << "Error: Number of items '" << header << "' on line " << lineNumber << " is out of range.\n";
            throw invalid_argument("PHYLIP header error");
        }
        log() << "Reading distance matrix of " << n << " items ...\n";

        // Rows are read before the matrix is allocated, so a wrong header fails on the missing rows.
        vector<vector<string> > rows;
        vector<size_t> rowLines;
        for (size_t i = 0; i < n; i++) {
            string line = nextLine(in);
            if (line.length() == 0) {
                cerr << "Error: Expected " << n << " rows but only " << i << " were found!\n";
                throw invalid_argument("Missing rows");
            }
            vector<string> tokens = tokenize(line);
            if (i == 0) layout = decideLayout(tokens.size() - 1, n);
            size_t nValues = expectedValues(i, n);
            if (tokens.size() - 1 != nValues) {
                cerr << "Error: Row of " << tokens[0] << " on line " << lineNumber << " has " << tokens.size() - 1 << " distances; expected " << nValues << ".\n";
                throw invalid_argument("Inconsistent row length");
            }
            rows.push_back(std::move(tokens));
            rowLines.push_back(lineNumber);
        }

        DistanceMatrix matrix(n);
        for (size_t i = 0; i < n; i++) {
            string const& name = rows[i][0];
            matrix.setName(i, name);
            for (size_t j = 0; j + 1 < rows[i].size(); j++) {
                double d = parseDistance(rows[i][j + 1], name, rowLines[i]);
                if (layout == Layout::SQUARE) matrix[i][j] = d;
                else matrix.set(i, j, d);
            }
        }
        if (nextLine(in).length() != 0) {
            LogInfo vlog(verbose + 1);
            vlog << "Warning: Content after the last row on line " << lineNumber << " is ignored.\n";
        }
        return matrix;
    }

    DistanceMatrix parse(const string& fileName) {
        ifstream fin(fileName);
        if (!fin.is_open()) {
            cerr << "Error: Unable to open distance matrix file '" << fileName << "'!\n";
            throw invalid_argument("Unable to open input file");
        }
        log() << "Processing " << fileName << " ... \n";
        return parse(fin);
    }
};

};

#endif
