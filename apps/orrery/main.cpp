#include "orrery/app/Program.h"
#include "orrery/core/Args.h"
#include "orrery/core/JsonWriter.h"
#include "orrery/core/Log.h"
#include "orrery/core/Random.h"
#include "orrery/io/JsonExport.h"
#include "orrery/io/TreeFile.h"
#include "orrery/out/EclipseOutput.h"
#include "orrery/out/JsonOutput.h"
#include "orrery/out/SvgOutput.h"
#include "orrery/proc/Artifexian.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace orrery;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitIo = 1;
constexpr int kExitUsage = 2;

void printHelp() {
  std::cout << "orrery <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  build                  Generate a galaxy and save it\n"
            << "    --stars <n>          Number of stars (default: 1000)\n"
            << "    --seed <u64|text>    Generator seed (default: 1337)\n"
            << "    --tree <path>        Body tree file (default: universe.tree)\n"
            << "    --observatories <p>  Observatory file (default: universe.obs)\n"
            << "    --json <path>        Also dump the tree as JSON\n"
            << "\n"
            << "  simulate               Observe a saved galaxy over time\n"
            << "    --tree <path>        Body tree file (required)\n"
            << "    --observatories <p>  Observatory file (required)\n"
            << "    --start <h>          First time step in hours (default: 0)\n"
            << "    --end <h>            Last time step in hours (default: 24)\n"
            << "    --step <h>           Step length in hours (default: 1)\n"
            << "    --out <dir>          Output root directory (default: out)\n"
            << "    --svg                Write star charts\n"
            << "    --json               Write observation dumps (default when no output is chosen)\n"
            << "    --eclipse            Log overlapping bodies\n"
            << "    --threads <n>        Worker threads (default: hardware threads)\n"
            << "\n"
            << "  info                   Summarize a saved body tree\n"
            << "    --tree <path>        Body tree file (required)\n"
            << "\n"
            << "Global:\n"
            << "  -v, --verbose          Debug logging\n"
            << "  -q, --quiet            Warnings and errors only\n"
            << "  -h, --help             This text\n";
}

int usageError(const std::string& message) {
  std::cerr << "orrery: " << message << "\n\n";
  printHelp();
  return kExitUsage;
}

// First token that is not an option; lets flag-vs-value keys depend on the command.
std::string peekCommand(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] && argv[i][0] != '-') return argv[i];
  }
  return {};
}

bool rejectUnknownKeys(const core::Args& args, const std::vector<std::string>& allowed, std::string& bad) {
  for (const auto& k : args.keys()) {
    if (std::find(allowed.begin(), allowed.end(), k) == allowed.end()) {
      bad = k;
      return false;
    }
  }
  return true;
}

int runBuild(const core::Args& args) {
  std::string bad;
  if (!rejectUnknownKeys(args, {"stars", "seed", "tree", "observatories", "json"}, bad)) {
    return usageError("unknown option --" + bad);
  }

  proc::ArtifexianConfig cfg{};
  if (args.has("stars")) {
    unsigned long long stars = 0;
    if (!args.getU64("stars", stars)) return usageError("--stars expects a non-negative integer");
    cfg.starCount = static_cast<std::size_t>(stars);
  }

  core::u64 seed = 1337;
  if (const auto s = args.last("seed")) {
    unsigned long long v = 0;
    seed = args.getU64("seed", v) ? static_cast<core::u64>(v) : core::seedFromString(*s);
  }

  std::string treePath = "universe.tree";
  std::string obsPath = "universe.obs";
  std::string jsonPath;
  (void)args.getString("tree", treePath);
  (void)args.getString("observatories", obsPath);
  (void)args.getString("json", jsonPath);

  const proc::ArtifexianGenerator generator(cfg);
  const auto universe = generator.generate(seed);
  if (!universe.tree) {
    core::log(core::LogLevel::Error, "build: generation produced no tree");
    return kExitIo;
  }

  if (!io::saveTreeToFile(*universe.tree, treePath)) return kExitIo;

  std::vector<sim::WeakObservatory> weak;
  weak.reserve(universe.observatories.size());
  for (const auto& o : universe.observatories) weak.push_back(o.toWeak());
  if (!io::saveObservatoriesToFile(weak, obsPath)) return kExitIo;

  if (!jsonPath.empty()) {
    std::ofstream f(jsonPath, std::ios::out | std::ios::trunc);
    if (!f) {
      core::log(core::LogLevel::Error, "build: failed to open " + jsonPath);
      return kExitIo;
    }
    core::JsonWriter w(f, /*pretty=*/true);
    io::writeTreeJson(w, *universe.tree);
    f << "\n";
    if (!f) {
      core::log(core::LogLevel::Error, "build: write failed: " + jsonPath);
      return kExitIo;
    }
  }

  std::cout << "seed " << seed << ": " << universe.stats.stars << " stars, " << universe.stats.planets
            << " planets, " << universe.stats.moons << " moons, " << universe.observatories.size()
            << " observatories\n"
            << "tree -> " << treePath << "\n"
            << "observatories -> " << obsPath << "\n";
  if (!jsonPath.empty()) std::cout << "json -> " << jsonPath << "\n";
  return kExitOk;
}

int runSimulate(const core::Args& args) {
  std::string bad;
  if (!rejectUnknownKeys(args, {"tree", "observatories", "start", "end", "step", "out", "threads"}, bad)) {
    return usageError("unknown option --" + bad);
  }

  std::string treePath;
  std::string obsPath;
  if (!args.getString("tree", treePath)) return usageError("simulate needs --tree");
  if (!args.getString("observatories", obsPath)) return usageError("simulate needs --observatories");

  double start = 0.0;
  double end = 24.0;
  double step = 1.0;
  if (args.has("start") && !args.getDouble("start", start)) return usageError("--start expects a number");
  if (args.has("end") && !args.getDouble("end", end)) return usageError("--end expects a number");
  if (args.has("step") && !args.getDouble("step", step)) return usageError("--step expects a number");
  if (!(step > 0.0)) return usageError("--step must be positive");
  if (end < start) return usageError("--end must not be before --start");

  app::ProgramConfig cfg{};
  std::string outDir;
  if (args.getString("out", outDir)) cfg.outputRoot = outDir;
  if (args.has("threads")) {
    unsigned long long threads = 0;
    if (!args.getU64("threads", threads)) return usageError("--threads expects a non-negative integer");
    cfg.threads = static_cast<unsigned>(threads);
  }

  std::shared_ptr<sim::BodyTree> tree;
  if (!io::loadTreeFromFile(treePath, tree)) return kExitIo;

  std::vector<sim::WeakObservatory> weak;
  if (!io::loadObservatoriesFromFile(obsPath, weak)) return kExitIo;

  std::shared_ptr<const sim::BodyTree> shared = tree;
  auto observatories = sim::resolveAll(weak, shared);
  if (observatories.size() < weak.size()) {
    core::log(core::LogLevel::Warn, "simulate: " + std::to_string(weak.size() - observatories.size()) +
                                        " observatories could not be resolved");
  }

  app::Program program(shared, std::move(observatories), cfg);

  bool wantJson = args.hasFlag("json");
  const bool wantSvg = args.hasFlag("svg");
  const bool wantEclipse = args.hasFlag("eclipse");
  if (!wantJson && !wantSvg && !wantEclipse) wantJson = true;

  if (wantSvg) program.addOutput(std::make_unique<out::SvgOutput>());
  if (wantJson) program.addOutput(std::make_unique<out::JsonOutput>());

  out::EclipseOutput* eclipse = nullptr;
  if (wantEclipse) {
    auto e = std::make_unique<out::EclipseOutput>();
    eclipse = e.get();
    program.addOutput(std::move(e));
  }

  const auto stats = program.run(start, end, step);

  std::cout << stats.frames << " frames, " << stats.observations << " observations";
  if (eclipse) std::cout << ", " << eclipse->eventCount() << " eclipses";
  std::cout << "\n";

  if (stats.failedWrites > 0) {
    std::cerr << stats.failedWrites << " frame writes failed\n";
    return kExitIo;
  }
  return kExitOk;
}

int runInfo(const core::Args& args) {
  std::string bad;
  if (!rejectUnknownKeys(args, {"tree"}, bad)) return usageError("unknown option --" + bad);

  std::string treePath;
  if (!args.getString("tree", treePath)) return usageError("info needs --tree");

  std::shared_ptr<sim::BodyTree> tree;
  if (!io::loadTreeFromFile(treePath, tree)) return kExitIo;

  const auto bodies = tree->snapshot();

  // Bodies per depth, root at depth 0.
  std::vector<std::size_t> perDepth;
  std::size_t named = 0;
  std::size_t rotating = 0;
  std::vector<std::pair<sim::BodyId, std::size_t>> stack{{sim::BodyTree::kRoot, 0}};
  while (!stack.empty()) {
    const auto [id, depth] = stack.back();
    stack.pop_back();
    if (perDepth.size() <= depth) perDepth.resize(depth + 1, 0);
    ++perDepth[depth];

    const sim::Body& b = bodies[id];
    if (b.name.state == sim::NameState::Named) ++named;
    if (b.rotation) ++rotating;
    for (sim::BodyId c : b.children) stack.emplace_back(c, depth + 1);
  }

  std::cout << treePath << ": " << bodies.size() << " bodies, depth " << (perDepth.size() - 1) << "\n";
  for (std::size_t d = 0; d < perDepth.size(); ++d) {
    std::cout << "  depth " << d << ": " << perDepth[d] << "\n";
  }
  std::cout << "  named: " << named << "\n"
            << "  rotating: " << rotating << "\n";
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Info);

  const std::string command = peekCommand(argc, argv);

  core::Args args;
  args.declareFlag("help");
  args.declareFlag("verbose");
  args.declareFlag("quiet");
  args.declareFlag("svg");
  args.declareFlag("eclipse");
  if (command == "simulate") args.declareFlag("json");
  args.parse(argc, argv);

  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return kExitOk;
  }
  if (args.hasFlag("verbose") || args.hasFlag("v")) core::setLogLevel(core::LogLevel::Debug);
  if (args.hasFlag("quiet") || args.hasFlag("q")) core::setLogLevel(core::LogLevel::Warn);

  if (!args.positional().empty()) return usageError("unexpected argument '" + args.positional().front() + "'");

  if (args.command() == "build") return runBuild(args);
  if (args.command() == "simulate") return runSimulate(args);
  if (args.command() == "info") return runInfo(args);

  if (args.command().empty()) return usageError("missing command");
  return usageError("unknown command '" + args.command() + "'");
}
