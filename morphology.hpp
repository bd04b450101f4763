# if !defined( __navimorph_morphology_hpp__ )
# define __navimorph_morphology_hpp__
# include "context/lemmatizer.hpp"
# include "grammar/word-form.hpp"
# include "trace.hpp"
# include <string_view>
# include <utility>

namespace navimorph {

 /*
  * Morphology
  *
  * Two entry points of the engine: analysis of a surface word to its lemma
  * and synthesis of surface forms from a lemma and a feature map. Each call
  * is reported to the trace hook at debug level, failures at error level
  * before the exception is passed to the caller.
  */
  class Morphology
  {
  public:
    Morphology( const lexicon::ExceptionIndex& = {}, const Trace::Func& = nullptr );

  public:
    auto  Lemmatize( const mtc::widestr& ) const -> mtc::widestr;
    auto  Lemmatize( const mtc::zval& ) const -> mtc::widestr;                                         // throws InvalidInput
    auto  Lemmatize( const std::string_view&, unsigned = codepages::codepage_utf8 ) const -> mtc::charstr;

    auto  Generate( Category, const mtc::widestr&, const mtc::zmap& = {} ) const -> std::vector<mtc::widestr>;  // throws UnknownCategoryOrFeature
    auto  Generate( const std::string_view&, const std::string_view&, const mtc::zmap& = {} ) const -> std::vector<mtc::charstr>;

    auto  GetLemmatizer() const -> const context::Lemmatizer&  {  return lemmatizer;  }

  protected:
    template <class Action>
    auto  Traced( const char*, const std::string&, Action ) const -> decltype(std::declval<Action>()());

  protected:
    context::Lemmatizer lemmatizer;
    Trace::Func         traceFunc;

  };

}

# endif   // !__navimorph_morphology_hpp__
