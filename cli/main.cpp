#include "spendcat/config.hpp"
#include "spendcat/corpus_reader.hpp"
#include "spendcat/formats.hpp"
#include "spendcat/frequency_store.hpp"
#include "spendcat/logging.hpp"
#include "spendcat/service.hpp"

#include <iostream>
#include <set>
#include <string>
#include <vector>

using namespace spendcat;

namespace {

void PrintUsage() {
  std::cerr << "Usage:\n"
            << "  spendcat_cli [options] predict <text...>\n"
            << "  spendcat_cli [options] train <transaction_id> <category> <text...> [--weight N]\n"
            << "  spendcat_cli [options] import <files...>\n"
            << "  spendcat_cli [options] stats\n"
            << "  spendcat_cli [options] export <output.json> [words...]\n"
            << "  spendcat_cli [options] reset\n"
            << "Options:\n"
            << "  --env <path>         KEY=VALUE config file (default .env)\n"
            << "  --db <path>          SQLite database (default spendcat.db)\n"
            << "  --lexicon <path>     JSON lexicon (default built-in)\n"
            << "  --log-level <level>  trace|debug|info|warn|error|off\n";
}

std::string DetectEnvPath(int argc, char** argv) {
  std::string path = ".env";
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--env") {
      path = argv[i + 1];
    }
  }
  return path;
}

// Splits global options off the front of argv; everything from the command
// name onward is returned in `rest`.
bool ParseGlobalArgs(int argc, char** argv, Config& cfg, std::vector<std::string>& rest, std::string& err) {
  int i = 1;
  for (; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) != 0) {
      break;
    }
    if (i + 1 >= argc) {
      err = "missing value for " + arg;
      return false;
    }
    std::string value = argv[++i];
    if (arg == "--env") {
      continue;
    } else if (arg == "--db") {
      cfg.db_path = value;
    } else if (arg == "--lexicon") {
      cfg.lexicon_path = value;
    } else if (arg == "--log-level") {
      cfg.log_level = value;
    } else {
      err = "unknown option: " + arg;
      return false;
    }
  }
  for (; i < argc; ++i) {
    rest.emplace_back(argv[i]);
  }
  if (rest.empty()) {
    err = "missing command";
    return false;
  }
  return true;
}

std::string JoinWords(const std::vector<std::string>& words, std::size_t begin, std::size_t end) {
  std::string out;
  for (std::size_t i = begin; i < end; ++i) {
    if (!out.empty()) out.push_back(' ');
    out += words[i];
  }
  return out;
}

int RunPredict(const CategorizationService& service, const std::vector<std::string>& args) {
  if (args.size() < 2) return 1;
  auto suggestion = service.Predict(JoinWords(args, 1, args.size()));
  if (!suggestion) {
    std::cout << "no text\n";
    return 0;
  }
  std::cout << "category:    " << suggestion->category.value_or("-") << "\n"
            << "confidence:  " << suggestion->confidence << "\n"
            << "source:      " << ToString(suggestion->source) << "\n"
            << "explanation: " << suggestion->explanation << "\n";
  return 0;
}

int RunTrain(CategorizationService& service, const std::vector<std::string>& args) {
  if (args.size() < 4) return 1;
  double weight = 1.0;
  std::size_t end = args.size();
  if (end >= 6 && args[end - 2] == "--weight") {
    weight = std::stod(args[end - 1]);
    end -= 2;
  }
  auto stats = service.Train(args[1], JoinWords(args, 3, end), args[2], weight);
  if (stats.skipped) {
    std::cout << "nothing to learn from that text\n";
  } else {
    std::cout << "trained " << args[2] << ": " << stats.tokens << " tokens, " << stats.new_words
              << " new words\n";
  }
  return 0;
}

int RunImport(CategorizationService& service, const std::vector<std::string>& args) {
  if (args.size() < 2) return 1;
  CorpusReader reader;
  std::size_t trained = 0;
  std::size_t skipped = 0;
  for (std::size_t i = 1; i < args.size(); ++i) {
    bool ok = reader.ForEachRecord(
        args[i],
        [&](const LabeledRecord& r) {
          const std::string text = r.text.empty() ? ComposeText({r.note, r.merchant}) : r.text;
          auto stats = service.Train(r.transaction_id, text, r.category, r.weight);
          if (stats.skipped) {
            ++skipped;
          } else {
            ++trained;
          }
        },
        &skipped);
    if (!ok) {
      std::cerr << "unable to read " << args[i] << "\n";
      return 2;
    }
  }
  std::cout << "imported " << trained << " records, skipped " << skipped << "\n";
  return 0;
}

int RunStats(const FrequencyStore& store) {
  std::cout << "vocab_size: " << store.GetVocabSize() << "\n"
            << "training_examples: " << store.CountTrainingExamples() << "\n";
  for (const auto& row : store.ListCategoryTotals()) {
    std::cout << "  " << row.category << ": docs=" << row.doc_count << " words=" << row.total_words << "\n";
  }
  return 0;
}

int RunExport(const FrequencyStore& store, const std::vector<std::string>& args) {
  if (args.size() < 2) return 1;
  std::set<std::string> words(args.begin() + 2, args.end());
  SaveModelJson(store, args[1], words);
  std::cout << "wrote " << args[1] << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  Config cfg;
  std::vector<std::string> args;
  try {
    cfg = LoadConfig(DetectEnvPath(argc, argv));
    std::string err;
    if (!ParseGlobalArgs(argc, argv, cfg, args, err)) {
      std::cerr << err << "\n";
      PrintUsage();
      return 1;
    }
    SetLogLevel(cfg.log_level);

    auto lexicon = cfg.lexicon_path.empty() ? Lexicon::Default() : Lexicon::FromJsonFile(cfg.lexicon_path);
    SqliteFrequencyStore store(cfg.db_path);
    CategorizationService service(lexicon, store, ToHybridOptions(cfg));

    const std::string& cmd = args[0];
    int rc = 1;
    if (cmd == "predict") {
      rc = RunPredict(service, args);
    } else if (cmd == "train") {
      rc = RunTrain(service, args);
    } else if (cmd == "import") {
      rc = RunImport(service, args);
    } else if (cmd == "stats") {
      rc = RunStats(store);
    } else if (cmd == "export") {
      rc = RunExport(store, args);
    } else if (cmd == "reset") {
      service.ResetModel();
      std::cout << "model reset\n";
      rc = 0;
    } else {
      std::cerr << "Unknown command: " << cmd << "\n";
    }
    if (rc == 1) {
      PrintUsage();
    }
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 3;
  }
}
