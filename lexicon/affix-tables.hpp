# if !defined( __navimorph_lexicon_affix_tables_hpp__ )
# define __navimorph_lexicon_affix_tables_hpp__
# include <moonycode/codes.h>
# include <mtc/wcsstr.h>
# include <utility>
# include <vector>

namespace navimorph {
namespace lexicon {

 /*
  * AffixTables
  *
  * Ordered affix lists used by the lemmatizer and the lenition table shared
  * with the generators. The order is the table order; longest-first matching
  * is computed by the caller at match time.
  */
  struct AffixTables
  {
    using AffixSet = std::vector<mtc::widestr>;
    using Lenition = std::vector<std::pair<mtc::widestr, mtc::widestr>>;

    AffixSet  numberPrefixes;
    AffixSet  caseSuffixes;
    AffixSet  verbSuffixes;
    Lenition  lenition;

    static  auto  Default() -> const AffixTables&;

  };

  // longest affix first, equal lengths keep table order
  auto  ByLength( const AffixTables::AffixSet& ) -> std::vector<const mtc::widestr*>;

}}

# endif   // !__navimorph_lexicon_affix_tables_hpp__
