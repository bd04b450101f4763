# if !defined( __navimorph_src_lexicon_load_file_hpp__ )
# define __navimorph_src_lexicon_load_file_hpp__
# include <mtc/zmap.h>
# include <string>

namespace navimorph {
namespace lexicon {

  auto  ReadFile( const std::string& ) -> std::string;          // throws mtc::file_error
  auto  ParseJson( const std::string& ) -> mtc::zval;           // throws std::invalid_argument
  auto  GetWideStr( const mtc::zval& ) -> const mtc::widestr;   // throws std::invalid_argument

}}

# endif   // !__navimorph_src_lexicon_load_file_hpp__
