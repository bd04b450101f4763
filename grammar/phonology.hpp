# if !defined( __navimorph_grammar_phonology_hpp__ )
# define __navimorph_grammar_phonology_hpp__
# include <moonycode/codes.h>
# include <mtc/wcsstr.h>
# include <mtc/zmap.h>
# include <initializer_list>
# include <utility>
# include <vector>
# include <map>

namespace navimorph {
namespace grammar {

 /*
  * Profile
  *
  * Phonological properties of a word ending. Never stored, always derived
  * from the trailing characters of the word it describes.
  */
  struct Profile
  {
    bool  endsWithVowel = false;
    bool  endsWithDiphthong = false;
    bool  endsWithPseudovowel = false;
  };

  using WordMap = std::map<mtc::widestr, mtc::widestr>;

  // utf-8 <-> utf-16 conversions
  inline  auto  W( const char* str ) -> mtc::widestr
    {  return codepages::mbcstowide( codepages::codepage_utf8, str );  }
  inline  auto  U8( const mtc::widestr& str ) -> mtc::charstr
    {  return codepages::widetombcs( codepages::codepage_utf8, str );  }

  auto  MakeWordMap( const std::initializer_list<std::pair<const char*, const char*>>& ) -> WordMap;

  bool  IsVowel( widechar ) noexcept;
  bool  StartsWith( const mtc::widestr&, const mtc::widestr& ) noexcept;
  bool  EndsWith( const mtc::widestr&, const mtc::widestr& ) noexcept;

  bool  EndsWithVowel( const mtc::widestr& ) noexcept;
  bool  EndsWithDiphthong( const mtc::widestr& );
  bool  EndsWithPseudovowel( const mtc::widestr& );
  auto  GetProfile( const mtc::widestr& ) -> Profile;

  auto  ToLower( const mtc::widestr& ) -> mtc::widestr;
  auto  Lenite( const mtc::widestr& ) -> mtc::widestr;
  auto  Syllabify( const mtc::widestr& ) -> std::vector<mtc::widestr>;

}}

# endif   // !__navimorph_grammar_phonology_hpp__
