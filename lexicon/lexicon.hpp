# if !defined( __navimorph_lexicon_lexicon_hpp__ )
# define __navimorph_lexicon_lexicon_hpp__
# include "../trace.hpp"
# include <moonycode/codes.h>
# include <mtc/interfaces.h>
# include <mtc/zmap.h>
# include <vector>

namespace navimorph {
namespace lexicon {

  struct LexRecord
  {
    mtc::widestr              surfaceForm;
    mtc::widestr              syllabicForm;
    mtc::widestr              acousticForm;
    mtc::widestr              partOfSpeech;
    std::vector<mtc::widestr> translations;
  };

  struct ILexicon: mtc::Iface
  {
    virtual auto  Lookup( const mtc::widestr& ) const -> const LexRecord* = 0;
    virtual auto  GetCount() const -> size_t = 0;
  };

  auto  CreateLexicon( std::vector<LexRecord>&& ) -> mtc::api<ILexicon>;

 /*
  * LoadLexicon( list, trace )
  *
  * Creates lexicon from the parsed array of dictionary records:
  *   { "navi": "...", "syllabic": "...", "acoustic": "...",
  *     "wordclass": "...", "translations": [ "...", ... ] }
  * Records without 'navi' string or with fields of invalid types are
  * skipped with a warning; a value that is not an array throws
  * invalid_argument.
  */
  auto  LoadLexicon( const mtc::zval&, const Trace::Func& = nullptr ) -> mtc::api<ILexicon>;

  auto  LoadJsonLexicon( const std::string&, const Trace::Func& = nullptr ) -> mtc::api<ILexicon>;   // throws file_error, invalid_argument

 /*
  * LoadTsvLexicon( path, trace )
  *
  * Reads a tab-separated dictionary with the header line naming at least the
  * columns 'Word (Na'vi)', 'POS' and 'Translation (en)'. A file without these
  * columns gives an empty lexicon and a warning.
  */
  auto  LoadTsvLexicon( const std::string&, const Trace::Func& = nullptr ) -> mtc::api<ILexicon>;    // throws file_error

}}

# endif   // !__navimorph_lexicon_lexicon_hpp__
