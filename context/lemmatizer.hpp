# if !defined( __navimorph_context_lemmatizer_hpp__ )
# define __navimorph_context_lemmatizer_hpp__
# include "../lexicon/exception-index.hpp"
# include "../lexicon/affix-tables.hpp"
# include "../exceptions.hpp"
# include <moonycode/codes.h>
# include <mtc/zmap.h>

namespace navimorph {
namespace context {

 /*
  * Lemmatizer
  *
  * Reduces a surface token to its lemma: irregular forms first, then one
  * pass of number prefix, case suffix and verb suffix stripping, each
  * stage applied at most once and independently of the others.
  */
  class Lemmatizer
  {
  public:
    Lemmatizer( const lexicon::ExceptionIndex& = {},
      const lexicon::AffixTables& = lexicon::AffixTables::Default() );
    Lemmatizer( const Lemmatizer& );
    auto  operator=( const Lemmatizer& ) -> Lemmatizer&;

  public:
    auto  Lemmatize( const widechar*, size_t ) const -> mtc::widestr;   // throws InvalidInput
    auto  Lemmatize( const mtc::widestr& ) const -> mtc::widestr;
    auto  Lemmatize( const mtc::zval& ) const -> mtc::widestr;          // throws InvalidInput

    auto  GetExceptions() const -> const lexicon::ExceptionIndex&  {  return exceptions;  }

  protected:
    auto  CutPrefix( const mtc::widestr& ) const -> mtc::widestr;
    auto  CutSuffix( const mtc::widestr&, const std::vector<const mtc::widestr*>&, bool guard ) const -> mtc::widestr;

  protected:
    lexicon::ExceptionIndex           exceptions;
    lexicon::AffixTables              affixes;
    std::vector<const mtc::widestr*>  caseSuffixes;
    std::vector<const mtc::widestr*>  verbSuffixes;

  };

}}

# endif // !__navimorph_context_lemmatizer_hpp__
