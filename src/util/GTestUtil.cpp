#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>
#include <vector>

// In order to display help options for gtest, testing::InitGoogleTest() must see "--help" in argv,
// and it then exits right after printing its own help. So we scan for "--help" first and print
// our own options before handing over.
//
// Our own options are parsed after InitGoogleTest() has stripped the gtest flags out of argv, so
// that --gtest_filter and friends do not trip the boost parser.
int launch_gtest(int argc, char** argv) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;
  util::Logging::Params log_params;
  log_params.log_level = "warn";

  po2::options_description raw_desc("Options");
  auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                .template add_option<"help-full">("help (all options)")
                .add(log_params.make_options_description());

  bool help_full = false;
  bool help = false;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--help-full") {
      help_full = true;
    } else if (std::string(argv[i]) == "--help") {
      help = true;
    }
  }
  if (help || help_full) {
    po2::Settings::help_full = help_full;
    std::cout << desc << std::endl;
  }
  if (help_full && !help) {
    argc = 2;
    argv[1] = const_cast<char*>("--help");
  }

  testing::InitGoogleTest(&argc, argv);

  try {
    po2::parse_args(desc, argc, argv);
    util::Logging::init(log_params);
  } catch (const util::CleanException& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  return RUN_ALL_TESTS();
}
