# if !defined( __navimorph_context_processor_hpp__ )
# define __navimorph_context_processor_hpp__
# include "../lexicon/lexicon.hpp"
# include "../trace.hpp"
# include "lemmatizer.hpp"
# include <moonycode/chartype.h>
# include <moonycode/codes.h>
# include <cstdio>

namespace navimorph {
namespace context {

 /*
  * Processor
  *
  * Sentence pipeline around the lemmatizer: blank-separated tokens are
  * lemmatized and looked up in the lexicon. Words missing in the lexicon
  * give a record with the original word and 'unknown' part of speech.
  */
  class Processor
  {
  public:
    using WordInfo = lexicon::LexRecord;
    using PosCount = std::pair<mtc::widestr, size_t>;

  public:
    Processor( const Lemmatizer&, const mtc::api<lexicon::ILexicon>& = nullptr, const Trace::Func& = nullptr );

  public:
    auto  GetWordInfo( const mtc::widestr& ) const -> WordInfo;
    auto  ParseSentence( const mtc::widestr& ) const -> std::vector<WordInfo>;

  public:
    static  auto  Tokenize( const mtc::widestr& ) -> std::vector<mtc::widestr>;
    static  void  SaveResults( FILE*, const std::vector<WordInfo>& );                // throws file_error
    static  auto  PosDistribution( const std::vector<WordInfo>& ) -> std::vector<PosCount>;

  protected:
    static  bool  IsPunct( widechar c )
    {
      return c == '.' || c == ',' || c == '!' || c == '?';
    }

  protected:
    Lemmatizer                  lemmatizer;
    mtc::api<lexicon::ILexicon> dictionary;
    Trace::Func                 traceFunc;

  };

}}

# endif // !__navimorph_context_processor_hpp__
