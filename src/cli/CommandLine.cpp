#include "cli/CommandLine.hpp"

#include <algorithm>
#include <boost/program_options.hpp>
#include <iostream>
#include <sstream>

#include "env/Locator.hpp"
#include "logger/logger.hpp"
#include "process/process.hpp"

namespace nativeBuild {
namespace po = boost::program_options;

namespace {
struct OptionParser : public po::options_description {
 private:
  po::positional_options_description positional;
  po::variables_map vm;

 public:
  OptionParser() : po::options_description("Options") {
    add_options()
        .operator()("native-image-path,n", po::value<std::string>(),
                    "Use a specific native-image binary.")
        .operator()("echo,e", "Print out native-image invocation.")
        .operator()("precompile,p", po::value<std::string>(),
                    "Namespaces to compile before the main ns, e.g. because "
                    "they contain gen-class directives, comma separated.")
        .operator()("compile-path,c", po::value<std::string>(),
                    "Directory compiled classes are written to. Defaults to "
                    "the descriptor's compilePath.")
        .operator()("help,h", "Output this help information.");
    positional.add("main", -1);
  }

  void parse(const std::vector<std::string> &args) {
    po::options_description all;
    all.add(*this).add_options()(
        "main", po::value<std::vector<std::string>>(), "main namespace");
    po::store(po::command_line_parser(args)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  }

  std::string getDesc() const {
    std::ostringstream os;
    os << "Usage: native-build [MAIN_NS] [OPTS] -- [NATIVE_IMAGE_ARGS]\n\n"
       << *this << '\n'
       << "If no --native-image-path is provided then it is searched for in "
          "$GRAALVM_HOME/bin, $GRAALVM_HOME, and $PATH.\n\n"
       << "Any arguments after -- are passed on verbatim to native-image.";
    return os.str();
  }

  const po::variable_value &operator[](const std::string &key) const {
    return vm[key];
  }

  bool contains(const std::string &key) const { return vm.contains(key); }
};

void printBinaryNotFound() {
  logger::error()
      << "Could not find GraalVM's native-image! Please make sure that the "
         "environment variable $GRAALVM_HOME is set. The native-image tool "
         "must also be installed ($GRAALVM_HOME/bin/gu install native-image)."
      << std::endl;
  logger::error()
      << "If you do not wish to set the GRAALVM_HOME environment variable, "
         "you can use the --native-image-path flag to set the binary "
         "explicitly. Try --help for options."
      << std::endl;
}
}  // namespace

CommandLine parseCommandLine(const std::vector<std::string> &args,
                             const Environment &env) {
  const auto separator = std::ranges::find(args, "--");
  const std::vector<std::string> ourArgs(args.begin(), separator);

  OptionParser op;
  op.parse(ourArgs);

  CommandLine cl;
  cl.help = op.contains("help");
  cl.helpText = op.getDesc();

  auto &options = cl.options;
  if (separator != args.end())
    options.extraArgs.assign(std::next(separator), args.end());

#define APPLY_IF_HAS(KEY, TYPE, FUNC) \
  {                                   \
    auto vv = op[KEY];                \
    if (!vv.empty()) {                \
      auto value = vv.as<TYPE>();     \
      FUNC;                           \
    }                                 \
  }

  APPLY_IF_HAS("main", std::vector<std::string>,
               options.entryUnit = value.front());
  APPLY_IF_HAS("precompile", std::string, options.precompile = value);
  APPLY_IF_HAS("compile-path", std::string, options.compilePath = value);
  APPLY_IF_HAS("native-image-path", std::string,
               options.nativeImagePath = value);
#undef APPLY_IF_HAS

  options.echo = op.contains("echo");
  if (!options.nativeImagePath) options.nativeImagePath = findNativeImage(env);
  return cl;
}

int runCommandLine(const std::vector<std::string> &args,
                   const Environment &env, const BuildFunc &build) {
  CommandLine cl;
  try {
    cl = parseCommandLine(args, env);
  } catch (const po::error &e) {
    logger::error() << "error: " << e.what() << std::endl;
    std::cerr << "Try --help for options." << std::endl;
    return 1;
  }

  if (cl.help) {
    std::cout << cl.helpText << std::endl;
    return 0;
  }
  if (!cl.options.nativeImagePath) {
    printBinaryNotFound();
    return 1;
  }
  if (cl.options.entryUnit.empty()) {
    logger::error() << MissingEntryUnit().what() << std::endl;
    std::cerr << cl.helpText << std::endl;
    return 1;
  }

  try {
    return build(cl.options);
  } catch (const process::LaunchFailure &e) {
    logger::error() << "error: " << e.what() << std::endl;
    logger::error() << "Check that $GRAALVM_HOME points at a GraalVM "
                       "installation with native-image installed, or pass "
                       "the binary with --native-image-path."
                    << std::endl;
    return 1;
  } catch (const std::exception &e) {
    logger::error() << "error: " << e.what() << std::endl;
    return 1;
  }
}
}  // namespace nativeBuild
