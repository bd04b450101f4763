# if !defined( __navimorph_config_hpp__ )
# define __navimorph_config_hpp__
# include "trace.hpp"
# include <mtc/zmap.h>
# include <string>

namespace navimorph {

 /*
  * Config
  *
  * Tool settings loaded from json:
  *   {
  *     "exceptions": "exceptions.json",
  *     "lexicon": { "type": "tsv" | "json", "path": "dictionary.tsv" },
  *     "output": "results.tsv",
  *     "log-level": "debug" | "info" | "warning" | "error"
  *   }
  * All the keys are optional.
  */
  struct Config
  {
    struct Lexicon
    {
      std::string type = "tsv";
      std::string path;
    };

    std::string   exceptions;
    Lexicon       lexicon;
    std::string   output;
    Trace::Level  logLevel = Trace::Level::info;

  };

  auto  LoadConfig( const mtc::zmap& ) -> Config;       // throws invalid_argument
  auto  LoadConfig( const std::string& ) -> Config;     // throws invalid_argument, file_error

}

# endif   // !__navimorph_config_hpp__
