/**
 * dsv - Command-line utility for delimited text using dsvkit
 *
 * Sniffs dialects, dumps fields and converts between dialects. Input is a
 * file or stdin; stdin is buffered in memory so that the sniffing sample
 * can be read again by the tokenizer.
 */

#include "dsvkit.h"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace std;

constexpr const char* VERSION = "0.1.0";

void printVersion() {
  cout << "dsv version " << VERSION << '\n';
}

void printUsage(const char* prog) {
  cerr << "dsv - delimited text toolkit\n\n";
  cerr << "Usage: " << prog << " <command> [options] [file]\n\n";
  cerr << "Commands:\n";
  cerr << "  dialect       Guess the dialect of the input\n";
  cerr << "  scores        List ranked separator/quote combinations\n";
  cerr << "  fields        Dump every field with its offset and flags\n";
  cerr << "  count         Count data rows (comments and empty lines excluded)\n";
  cerr << "  convert       Re-write the input with another dialect\n";
  cerr << "  preamble      Print the length of the preamble in bytes\n";
  cerr << "\nArguments:\n";
  cerr << "  file          Path to the input, or '-' to read from stdin.\n";
  cerr << "                If omitted, reads from stdin.\n";
  cerr << "\nOptions:\n";
  cerr << "  -d <sep>      Field separator (disables auto-detection)\n";
  cerr << "                Values: comma, tab, semicolon, pipe, space, or single character\n";
  cerr << "  -q <char>     Quote character, or 'none' (default: \")\n";
  cerr << "  -e <char>     Escape character (default: same as quote)\n";
  cerr << "  -c <prefix>   Comment prefix, or 'none' (default: #)\n";
  cerr << "  -X            Strict quoting: no blanks around quotes\n";
  cerr << "  -s <bytes>    Sample size for auto-detection (default: " << DSVKIT_SAMPLE_SIZE
       << ")\n";
  cerr << "  -S            Strict sniffing: no unverified guesses\n";
  cerr << "  -P            Skip the preamble (and BOM) before reading\n";
  cerr << "  -o <sep>      Output separator (for convert, default: comma)\n";
  cerr << "  -A            Quote every field (for convert)\n";
  cerr << "  -j            Output in JSON format (for dialect and scores)\n";
  cerr << "  -D            Print debug trace and timing to stderr\n";
  cerr << "  -h            Show this help message\n";
  cerr << "  -v            Show version information\n";
  cerr << "\nExamples:\n";
  cerr << "  " << prog << " dialect unknown_format.csv\n";
  cerr << "  " << prog << " dialect -j data.csv       # JSON output\n";
  cerr << "  " << prog << " count -d tab data.tsv\n";
  cerr << "  " << prog << " convert -o tab data.csv > data.tsv\n";
  cerr << "  cat data.csv | " << prog << " fields\n";
}

struct CliOptions {
  bool separator_given = false;
  char separator = ',';
  bool quote_given = false;
  char quote = '"';
  bool escape_given = false;
  char escape = '"';
  bool comment_given = false;
  std::string comment = "#";
  bool strict_quotes = false;
  size_t sample_size = DSVKIT_SAMPLE_SIZE;
  bool strict_sniff = false;
  bool skip_preamble = false;
  char output_separator = ',';
  bool always_quote = false;
  bool json_output = false;
  dsvkit::DebugConfig debug;
};

// Input opened once per command. Files are read twice (sample, then the
// stream); stdin is held in memory.
struct Input {
  std::string sample;
  std::string stdin_data;
  std::ifstream file;
  std::istringstream memory;
  std::istream* stream = nullptr;
};

// Helper to check if reading from stdin
static bool isStdinInput(const char* filename) {
  return filename == nullptr || strcmp(filename, "-") == 0;
}

static bool parseSeparator(const std::string& str, char& out) {
  if (str == "comma" || str == ",") {
    out = ',';
  } else if (str == "tab" || str == "\\t") {
    out = '\t';
  } else if (str == "semicolon" || str == ";") {
    out = ';';
  } else if (str == "pipe" || str == "|") {
    out = '|';
  } else if (str == "space") {
    out = ' ';
  } else if (str.length() == 1) {
    out = str[0];
  } else {
    return false;
  }
  return true;
}

static bool parseChar(const char* arg, char& out) {
  if (strcmp(arg, "none") == 0) {
    out = '\0';
    return true;
  }
  if (strcmp(arg, "\\t") == 0) {
    out = '\t';
    return true;
  }
  if (strlen(arg) == 1) {
    out = arg[0];
    return true;
  }
  return false;
}

// Loads the sample and opens the stream. Returns false after reporting an error.
static bool openInput(const char* filename, const CliOptions& opts, Input& in) {
  try {
    if (isStdinInput(filename)) {
      in.stdin_data = dsvkit::read_all(std::cin);
      in.sample = in.stdin_data.substr(0, opts.sample_size);
    } else {
      in.sample = dsvkit::load_sample(filename, opts.sample_size);
    }
  } catch (const std::exception& e) {
    if (isStdinInput(filename)) {
      cerr << "Error: Could not read from stdin: " << e.what() << endl;
    } else {
      cerr << "Error: Could not load file '" << filename << "': " << e.what() << endl;
    }
    return false;
  }

  const uint8_t* bytes = reinterpret_cast<const uint8_t*>(in.sample.data());
  size_t skip = opts.skip_preamble ? dsvkit::preamble_length(bytes, in.sample.size())
                                   : dsvkit::bom_length(bytes, in.sample.size());
  in.sample.erase(0, skip);

  if (isStdinInput(filename)) {
    in.memory.str(in.stdin_data.substr(skip));
    in.stream = &in.memory;
  } else {
    in.file.open(filename, std::ios::binary);
    if (!in.file) {
      cerr << "Error: Could not load file '" << filename << "': could not open file" << endl;
      return false;
    }
    in.file.seekg(static_cast<std::streamoff>(skip));
    in.stream = &in.file;
  }
  return true;
}

static dsvkit::SnifferOptions snifferOptions(const CliOptions& opts) {
  dsvkit::SnifferOptions sniff;
  sniff.strict = opts.strict_sniff;
  sniff.sample_size = opts.sample_size;
  sniff.debug = opts.debug;
  return sniff;
}

static const uint8_t* sampleBytes(const Input& in) {
  return reinterpret_cast<const uint8_t*>(in.sample.data());
}

// Resolves the reading dialect: explicit options win, the rest is sniffed.
static bool resolveDialect(const CliOptions& opts, const Input& in,
                           dsvkit::DialectParameters& dialect) {
  if (!opts.separator_given) {
    dsvkit::Sniffer sniffer(sampleBytes(in), in.sample.size(), snifferOptions(opts));
    dsvkit::GuessResult guess = sniffer.guess_parameters();
    if (!guess.success()) {
      cerr << "Error: Could not detect the dialect" << endl;
      return false;
    }
    dialect = *guess.dialect;
    if (!guess.verified) {
      cerr << "Warning: Dialect could not be verified, using " << dialect.to_string() << endl;
    }
  } else {
    dialect.separator = opts.separator;
  }

  if (opts.quote_given) {
    dialect.set_quote(opts.quote);
  }
  if (opts.escape_given) {
    dialect.escape = opts.escape;
  }
  if (opts.comment_given) {
    dialect.comment = opts.comment;
  }
  if (opts.strict_quotes) {
    dialect.quote_mode = dsvkit::QuoteMode::STRICT;
  }

  std::string problem = dialect.validation_error();
  if (!problem.empty()) {
    cerr << "Error: Invalid dialect: " << problem << endl;
    return false;
  }
  return true;
}

static dsvkit::TokenizerOptions tokenizerOptions(const CliOptions& opts) {
  dsvkit::TokenizerOptions tok;
  tok.debug = opts.debug;
  return tok;
}

static int reportTokenizerError(const dsvkit::Tokenizer& tokenizer) {
  cerr << "Error: " << tokenizer.error()->to_string() << endl;
  return 1;
}

// Helper: escape a string for JSON (and for the fields dump)
static std::string escapeJson(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      // Escape other control characters (0x00-0x1F) as \uXXXX
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[7];
        snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
        out += buf;
      } else {
        out += c;
      }
    }
  }
  return out;
}

static std::string jsonChar(char c) {
  return c == '\0' ? std::string("null") : "\"" + escapeJson(std::string_view(&c, 1)) + "\"";
}

// Helper: printable name followed by the byte itself
static std::string formatChar(char c) {
  std::string name = dsvkit::describe_char(c);
  if (c == '\0' || c == '\t' || c == '\n' || c == ' ') {
    return name;
  }
  return name + " (" + std::string(1, c) + ")";
}

// Command: dialect - guess and output the dialect in human-readable or JSON format
int cmdDialect(const char* filename, const CliOptions& opts) {
  Input in;
  if (!openInput(filename, opts, in)) {
    return 1;
  }

  dsvkit::Sniffer sniffer(sampleBytes(in), in.sample.size(), snifferOptions(opts));
  dsvkit::GuessResult result = sniffer.guess_parameters();
  if (!result.success()) {
    cerr << "Error: Could not detect the dialect" << endl;
    return 1;
  }
  const dsvkit::DialectParameters& d = *result.dialect;

  if (opts.json_output) {
    cout << "{\n";
    cout << "  \"separator\": " << jsonChar(d.separator) << ",\n";
    cout << "  \"quote\": " << jsonChar(d.quote) << ",\n";
    cout << "  \"escape\": " << jsonChar(d.escape) << ",\n";
    cout << "  \"comment\": ";
    if (d.comment.empty()) {
      cout << "null";
    } else {
      cout << "\"" << escapeJson(d.comment) << "\"";
    }
    cout << ",\n";
    cout << "  \"verified\": " << (result.verified ? "true" : "false") << "\n";
    cout << "}\n";
  } else {
    cout << "Detected dialect:\n";
    cout << "  Separator:    " << formatChar(d.separator) << "\n";
    cout << "  Quote:        " << formatChar(d.quote) << "\n";
    cout << "  Escape:       "
         << (d.escape != '\0' && d.escape == d.quote ? std::string("doubled quote")
                                                     : formatChar(d.escape))
         << "\n";
    cout << "  Comment:      " << (d.comment.empty() ? std::string("none") : d.comment) << "\n";
    cout << "  Verified:     " << (result.verified ? "yes" : "no") << "\n";
    cout << "\n";

    // Output CLI flags that can be reused
    cout << "CLI flags: -d " << (d.separator == '\t' ? std::string("tab") : std::string(1, d.separator));
    if (d.quote != '"') {
      cout << " -q " << (d.quote == '\0' ? std::string("none") : std::string(1, d.quote));
    }
    if (d.escape != d.quote && d.escape != '\0') {
      cout << " -e " << d.escape;
    }
    if (d.comment != "#") {
      cout << " -c " << (d.comment.empty() ? std::string("none") : d.comment);
    }
    cout << "\n";
  }
  return 0;
}

// Command: scores - ranked separator/quote combinations
int cmdScores(const char* filename, const CliOptions& opts) {
  Input in;
  if (!openInput(filename, opts, in)) {
    return 1;
  }

  dsvkit::Sniffer sniffer(sampleBytes(in), in.sample.size(), snifferOptions(opts));
  std::vector<dsvkit::SepQuoteScore> scores = sniffer.sep_quote_scores();

  if (opts.json_output) {
    cout << "[\n";
    for (size_t i = 0; i < scores.size(); ++i) {
      cout << "  {\"separator\": " << jsonChar(scores[i].separator)
           << ", \"quote\": " << jsonChar(scores[i].quote) << ", \"score\": " << scores[i].score
           << "}" << (i + 1 < scores.size() ? "," : "") << "\n";
    }
    cout << "]\n";
  } else {
    for (const auto& s : scores) {
      cout << formatChar(s.separator) << "\t" << formatChar(s.quote) << "\t" << s.score << "\n";
    }
  }
  return 0;
}

// Command: fields - one line per field: offset, flags, content
int cmdFields(const char* filename, const CliOptions& opts, dsvkit::DebugTrace& trace) {
  Input in;
  if (!openInput(filename, opts, in)) {
    return 1;
  }
  dsvkit::DialectParameters dialect;
  if (!resolveDialect(opts, in, dialect)) {
    return 1;
  }

  dsvkit::Tokenizer tokenizer(*in.stream, dialect, tokenizerOptions(opts));
  {
    dsvkit::ScopedPhaseTimer timer(trace, "fields");
    while (tokenizer.next()) {
      const dsvkit::Field& f = tokenizer.current();
      char flags[6] = {f.at_row_start ? 'S' : '-', f.at_row_end ? 'E' : '-',
                       f.is_comment ? 'C' : '-',   f.is_quoted ? 'Q' : '-',
                       f.is_empty_line ? 'L' : '-', '\0'};
      cout << f.offset << '\t' << flags << "\t\"" << escapeJson(f.data) << "\"\n";
    }
    timer.set_bytes(tokenizer.bytes_read());
  }
  if (tokenizer.has_error()) {
    return reportTokenizerError(tokenizer);
  }
  return 0;
}

// Command: count - number of data rows
int cmdCount(const char* filename, const CliOptions& opts, dsvkit::DebugTrace& trace) {
  Input in;
  if (!openInput(filename, opts, in)) {
    return 1;
  }
  dsvkit::DialectParameters dialect;
  if (!resolveDialect(opts, in, dialect)) {
    return 1;
  }

  dsvkit::Tokenizer tokenizer(*in.stream, dialect, tokenizerOptions(opts));
  size_t rows = 0;
  {
    dsvkit::ScopedPhaseTimer timer(trace, "count");
    while (tokenizer.next()) {
      if (tokenizer.at_row_start() && !tokenizer.is_comment() && !tokenizer.is_empty_line()) {
        ++rows;
      }
    }
    timer.set_bytes(tokenizer.bytes_read());
  }
  if (tokenizer.has_error()) {
    return reportTokenizerError(tokenizer);
  }
  cout << rows << endl;
  return 0;
}

// Command: convert - re-write the input with the output separator
int cmdConvert(const char* filename, const CliOptions& opts, dsvkit::DebugTrace& trace) {
  Input in;
  if (!openInput(filename, opts, in)) {
    return 1;
  }
  dsvkit::DialectParameters dialect;
  if (!resolveDialect(opts, in, dialect)) {
    return 1;
  }

  dsvkit::WriterOptions wopts;
  wopts.separator = opts.output_separator;
  if (dialect.quote != '\0' && dialect.quote != wopts.separator) {
    wopts.set_quote(dialect.quote);
  }
  if (!dialect.comment.empty()) {
    wopts.reader_comment = dialect.comment;
  }
  wopts.enquote = opts.always_quote ? dsvkit::EnquotePolicy::ALWAYS : dsvkit::EnquotePolicy::MINIMAL;

  dsvkit::Tokenizer tokenizer(*in.stream, dialect, tokenizerOptions(opts));
  std::unique_ptr<dsvkit::Writer> writer;
  try {
    writer = std::make_unique<dsvkit::Writer>(cout, wopts);
  } catch (const dsvkit::ParseException& e) {
    cerr << "Error: " << e.what() << endl;
    return 1;
  }

  {
    dsvkit::ScopedPhaseTimer timer(trace, "convert");
    while (tokenizer.next() && !writer->has_error()) {
      if (tokenizer.is_comment()) {
        writer->write_comment(tokenizer.field());
      } else if (tokenizer.is_empty_line()) {
        writer->empty_row();
      } else {
        writer->write_field(tokenizer.field());
        if (tokenizer.at_row_end()) {
          writer->new_row();
        }
      }
    }
    writer->flush();
    timer.set_bytes(tokenizer.bytes_read());
  }

  if (tokenizer.has_error()) {
    return reportTokenizerError(tokenizer);
  }
  if (writer->has_error()) {
    cerr << "Error: " << writer->error()->to_string() << endl;
    return 1;
  }
  return 0;
}

// Command: preamble - length of the preamble (BOM included) found in the sample
int cmdPreamble(const char* filename, const CliOptions& opts) {
  std::string sample;
  try {
    sample = isStdinInput(filename) ? dsvkit::read_prefix(std::cin, opts.sample_size)
                                    : dsvkit::load_sample(filename, opts.sample_size);
  } catch (const std::exception& e) {
    if (isStdinInput(filename)) {
      cerr << "Error: Could not read from stdin: " << e.what() << endl;
    } else {
      cerr << "Error: Could not load file '" << filename << "': " << e.what() << endl;
    }
    return 1;
  }
  cout << dsvkit::preamble_length(reinterpret_cast<const uint8_t*>(sample.data()), sample.size())
       << endl;
  return 0;
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  // Check for help or version
  if (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0) {
    printUsage(argv[0]);
    return 0;
  }
  if (strcmp(argv[1], "-v") == 0 || strcmp(argv[1], "--version") == 0) {
    printVersion();
    return 0;
  }

  // Parse command
  string command = argv[1];

  // Skip command for option parsing
  optind = 2;

  CliOptions opts;
  int c;
  while ((c = getopt(argc, argv, "d:q:e:c:Xs:SPo:AjDhv")) != -1) {
    switch (c) {
    case 'd':
      if (!parseSeparator(optarg, opts.separator)) {
        cerr << "Error: Unknown separator '" << optarg << "'\n";
        return 1;
      }
      opts.separator_given = true;
      break;
    case 'q':
      if (!parseChar(optarg, opts.quote)) {
        cerr << "Error: Quote character must be a single character or 'none'\n";
        return 1;
      }
      opts.quote_given = true;
      break;
    case 'e':
      if (!parseChar(optarg, opts.escape)) {
        cerr << "Error: Escape character must be a single character or 'none'\n";
        return 1;
      }
      opts.escape_given = true;
      break;
    case 'c':
      opts.comment = strcmp(optarg, "none") == 0 ? std::string() : std::string(optarg);
      opts.comment_given = true;
      break;
    case 'X':
      opts.strict_quotes = true;
      break;
    case 's': {
      char* endptr;
      long val = strtol(optarg, &endptr, 10);
      if (*endptr != '\0' || val <= 0) {
        cerr << "Error: Invalid sample size '" << optarg << "'\n";
        return 1;
      }
      opts.sample_size = static_cast<size_t>(val);
      break;
    }
    case 'S':
      opts.strict_sniff = true;
      break;
    case 'P':
      opts.skip_preamble = true;
      break;
    case 'o':
      if (!parseSeparator(optarg, opts.output_separator)) {
        cerr << "Error: Unknown output separator '" << optarg << "'\n";
        return 1;
      }
      break;
    case 'A':
      opts.always_quote = true;
      break;
    case 'j':
      opts.json_output = true;
      break;
    case 'D':
      opts.debug.verbose = true;
      opts.debug.timing = true;
      opts.debug.output = stderr;
      break;
    case 'h':
      printUsage(argv[0]);
      return 0;
    case 'v':
      printVersion();
      return 0;
    default:
      printUsage(argv[0]);
      return 1;
    }
  }

  // Allow reading from stdin if no filename is specified
  const char* filename = nullptr;
  if (optind < argc) {
    filename = argv[optind];
  }

  dsvkit::DebugTrace trace(opts.debug);

  // Dispatch to command handlers
  int result = 0;
  if (command == "dialect") {
    result = cmdDialect(filename, opts);
  } else if (command == "scores") {
    result = cmdScores(filename, opts);
  } else if (command == "fields") {
    result = cmdFields(filename, opts, trace);
  } else if (command == "count") {
    result = cmdCount(filename, opts, trace);
  } else if (command == "convert") {
    result = cmdConvert(filename, opts, trace);
  } else if (command == "preamble") {
    result = cmdPreamble(filename, opts);
  } else {
    cerr << "Error: Unknown command '" << command << "'\n";
    printUsage(argv[0]);
    return 1;
  }

  trace.print_timing_summary();

  std::cout.flush();
  std::cerr.flush();
  return result;
}
