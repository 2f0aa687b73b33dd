#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "state.hpp"
#include "state_file_operations.hpp"

using namespace std;

// A number found on a line and the column offset where it starts.
struct Token {
    int value;
    size_t position;
};

static bool is_blank_line(const string& line) {
    return all_of(line.begin(), line.end(), [](unsigned char c) { return isspace(c); });
}

static string trim(const string& s) {
    size_t first = 0;
    while (first < s.size() && isspace(static_cast<unsigned char>(s[first]))) ++first;
    size_t last = s.size();
    while (last > first && isspace(static_cast<unsigned char>(s[last - 1]))) --last;
    return s.substr(first, last - first);
}

static int parse_int(const string& token) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = stoi(token, &consumed);
    } catch (const out_of_range&) {
        throw invalid_argument("Number out of range: '" + token + "'");
    } catch (const invalid_argument&) {
        throw invalid_argument("Invalid number: '" + token + "'");
    }
    if (consumed != token.size()) {
        throw invalid_argument("Invalid number: '" + token + "'");
    }
    return value;
}

static vector<string> split(const string& line, char delimiter) {
    vector<string> parts;
    size_t start = 0;
    while (true) {
        size_t end = line.find(delimiter, start);
        if (end == string::npos) {
            parts.push_back(line.substr(start));
            break;
        }
        parts.push_back(line.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

static bool is_permutation_of_cells(const vector<int>& flat, int n) {
    set<int> values(flat.begin(), flat.end());
    return static_cast<int>(flat.size()) == n * n && static_cast<int>(values.size()) == n * n &&
           *values.begin() == 0 && *values.rbegin() == n * n - 1;
}

static string exactly_once_message(int n) {
    return "Board must contain all numbers 0.." + to_string(n * n - 1) + " exactly once.";
}

static string join_values(const vector<int>& values) {
    string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out += ", ";
        out += to_string(values[i]);
    }
    return out + "]";
}

static State make_state(const vector<int>& flat, int n) {
    if (!is_permutation_of_cells(flat, n)) {
        throw invalid_argument(exactly_once_message(n));
    }
    return State(flat, n);
}

// Returns false (leaving flat untouched) when some line does not have exactly n fields.
static bool parse_tab_delimited(const vector<string>& lines, int n, vector<int>& flat) {
    vector<int> values;
    for (const string& line : lines) {
        vector<string> parts = split(line, '\t');
        if (static_cast<int>(parts.size()) != n) {
            return false;
        }
        for (const string& part : parts) {
            string cell = trim(part);
            values.push_back(cell.empty() ? 0 : parse_int(cell));
        }
    }
    flat = values;
    return true;
}

static vector<Token> find_numbers(const string& line) {
    static const regex number_pattern("[0-9]+");
    vector<Token> tokens;
    for (sregex_iterator it(line.begin(), line.end(), number_pattern), end; it != end; ++it) {
        tokens.push_back(Token{parse_int(it->str()), static_cast<size_t>(it->position())});
    }
    return tokens;
}

static vector<int> parse_whitespace(const vector<string>& lines, int n) {
    vector<int> flat;
    for (const string& line : lines) {
        istringstream in(line);
        string word;
        int count = 0;
        while (in >> word) {
            flat.push_back(parse_int(word));
            ++count;
        }
        if (count != n) {
            throw invalid_argument(
                "Could not parse as tab-delimited or space-aligned grid. "
                "If using spaces, the file must be column-aligned; otherwise include 0 for blank.");
        }
    }
    return flat;
}

// Rebuild the row missing its blank by matching numbers to the column offsets of a full row.
static vector<int> fill_row(const vector<Token>& tokens, const vector<size_t>& anchors, size_t tolerance, int n) {
    if (static_cast<int>(tokens.size()) == n) {
        vector<int> row;
        for (const Token& t : tokens) row.push_back(t.value);
        return row;
    }
    vector<int> row;
    size_t j = 0;
    for (int i = 0; i < n; ++i) {
        if (j >= tokens.size()) {
            row.push_back(0);
            continue;
        }
        size_t pos = tokens[j].position;
        size_t distance = pos > anchors[i] ? pos - anchors[i] : anchors[i] - pos;
        if (distance <= tolerance) {
            row.push_back(tokens[j].value);
            ++j;
        } else {
            row.push_back(0);
        }
    }
    return row;
}

static State parse_space_aligned(const vector<string>& lines, int n) {
    vector<vector<Token>> rows;
    vector<int> counts;
    for (const string& line : lines) {
        rows.push_back(find_numbers(line));
        counts.push_back(static_cast<int>(rows.back().size()));
    }

    if (all_of(counts.begin(), counts.end(), [n](int c) { return c == n; })) {
        vector<int> flat;
        for (const auto& row : rows) {
            for (const Token& t : row) flat.push_back(t.value);
        }
        return make_state(flat, n);
    }

    int max_count = *max_element(counts.begin(), counts.end());
    bool counts_ok = all_of(counts.begin(), counts.end(), [n](int c) { return c == n || c == n - 1; });
    if (max_count != n || !counts_ok || count(counts.begin(), counts.end(), n - 1) != 1) {
        return make_state(parse_whitespace(lines, n), n);
    }

    // exactly one row lacks the blank; the first complete row supplies the column offsets
    size_t anchor_row = find(counts.begin(), counts.end(), n) - counts.begin();
    vector<size_t> anchors;
    for (const Token& t : rows[anchor_row]) anchors.push_back(t.position);
    size_t min_step = anchors[1] - anchors[0];
    for (int i = 1; i + 1 < n; ++i) min_step = min(min_step, anchors[i + 1] - anchors[i]);
    size_t tolerance = max<size_t>(1, min_step / 2);

    vector<int> flat;
    for (const auto& row : rows) {
        vector<int> filled = fill_row(row, anchors, tolerance, n);
        flat.insert(flat.end(), filled.begin(), filled.end());
    }

    if (!is_permutation_of_cells(flat, n)) {
        set<int> present(flat.begin(), flat.end());
        vector<int> missing;
        vector<int> extra;
        for (int v = 0; v < n * n; ++v) {
            if (!present.count(v)) missing.push_back(v);
        }
        for (int v : present) {
            if (v < 0 || v >= n * n) extra.push_back(v);
        }
        throw invalid_argument("Parsed grid, but numbers are wrong. Missing=" + join_values(missing) +
                               ", Extra=" + join_values(extra) +
                               ". Your file may not be consistently column-aligned.");
    }
    return State(flat, n);
}

State parse_state(const string& text) {
    vector<string> lines;
    for (string line : split(text, '\n')) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!is_blank_line(line)) lines.push_back(line);
    }

    int n = static_cast<int>(lines.size());
    if (n < MIN_SIDE_LENGTH || n > MAX_SIDE_LENGTH) {
        throw invalid_argument("n must be between " + to_string(MIN_SIDE_LENGTH) + " and " +
                               to_string(MAX_SIDE_LENGTH) + ", got n=" + to_string(n));
    }

    bool has_tabs = any_of(lines.begin(), lines.end(),
                           [](const string& line) { return line.find('\t') != string::npos; });
    if (has_tabs) {
        vector<int> flat;
        if (parse_tab_delimited(lines, n, flat)) {
            return make_state(flat, n);
        }
    }
    return parse_space_aligned(lines, n);
}

State read_state_from_file(const string& filename) {
    ifstream infile(filename);
    if (!infile.is_open()) {
        throw runtime_error("Could not open file: " + filename);
    }
    stringstream buffer;
    buffer << infile.rdbuf();
    return parse_state(buffer.str());
}

void write_state_to_file(const State& state, const string& filename) {
    ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw runtime_error("Could not open file for writing: " + filename);
    }
    int n = state.get_side_length();
    size_t width = to_string(n * n - 1).size();
    for (int row = 0; row < n; ++row) {
        for (int col = 0; col < n; ++col) {
            string cell = to_string(state.at(row, col));
            if (col) outfile << ' ';
            outfile << string(width - cell.size(), ' ') << cell;
        }
        outfile << '\n';
    }
}

string format_board(const State& state) {
    int n = state.get_side_length();
    size_t width = to_string(n * n - 1).size();
    string out;
    for (int row = 0; row < n; ++row) {
        if (row) out += '\n';
        for (int col = 0; col < n; ++col) {
            if (col) out += ' ';
            int value = state.at(row, col);
            if (value == 0) {
                out += string(width, ' ');
            } else {
                string cell = to_string(value);
                out += string(width - cell.size(), ' ') + cell;
            }
        }
    }
    return out;
}
