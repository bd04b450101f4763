# include "../../context/processor.hpp"
# include "../../grammar/phonology.hpp"
# include <mtc/exceptions.h>
# include <algorithm>

namespace navimorph {
namespace context {

  Processor::Processor( const Lemmatizer& lemma, const mtc::api<lexicon::ILexicon>& lexicon, const Trace::Func& trace ):
    lemmatizer( lemma ),
    dictionary( lexicon ),
    traceFunc( trace )  {}

  auto  Processor::GetWordInfo( const mtc::widestr& word ) const -> WordInfo
  {
    auto  lemma = lemmatizer.Lemmatize( grammar::ToLower( word ) );
    auto  found = dictionary != nullptr ? dictionary->Lookup( lemma ) : nullptr;

    Report( traceFunc, Trace::Level::debug, "GetWordInfo( '%s' ): lemma '%s', %s",
      grammar::U8( word ).c_str(), grammar::U8( lemma ).c_str(), found != nullptr ? "found" : "not found" );

    if ( found != nullptr )
      return *found;

    return { word, {}, {}, grammar::W( "unknown" ), {} };
  }

  auto  Processor::ParseSentence( const mtc::widestr& sentence ) const -> std::vector<WordInfo>
  {
    auto  output = std::vector<WordInfo>();

    for ( auto& next: Tokenize( sentence ) )
      output.push_back( GetWordInfo( next ) );

    return output;
  }

 /*
  * Tokenize( sentence )
  *
  * Splits the string by blanks and strips sentence punctuation from both
  * ends of each word; tokens left empty are dropped.
  */
  auto  Processor::Tokenize( const mtc::widestr& sentence ) -> std::vector<mtc::widestr>
  {
    auto  output = std::vector<mtc::widestr>();
    auto  ptrtop = sentence.c_str();
    auto  ptrend = ptrtop + sentence.length();

    while ( ptrtop != ptrend )
    {
      const widechar* origin;
      const widechar* ptrlim;

      // skip spaces
      while ( ptrtop != ptrend && codepages::IsBlank( *ptrtop ) )
        ++ptrtop;

      // select next word
      for ( origin = ptrtop; ptrtop != ptrend && !codepages::IsBlank( *ptrtop ); ++ptrtop )
        (void)NULL;

      // strip punctuation
      for ( ptrlim = ptrtop; origin != ptrlim && IsPunct( *origin ); ++origin )
        (void)NULL;
      while ( ptrlim != origin && IsPunct( ptrlim[-1] ) )
        --ptrlim;

      if ( ptrlim != origin )
        output.emplace_back( origin, ptrlim - origin );
    }

    return output;
  }

  void  Processor::SaveResults( FILE* output, const std::vector<WordInfo>& records )
  {
    auto  PutLine = [output]( const mtc::charstr& line )
      {
        if ( fprintf( output, "%s\n", line.c_str() ) < 0 )
          throw mtc::file_error( "could not write results" );
      };

    PutLine( "navi\tsyllabic\tacoustic\tpos\ttranslations" );

    for ( auto& next: records )
    {
      auto  translated = mtc::widestr();

      for ( auto& tr: next.translations )
        translated += (translated.empty() ? mtc::widestr() : grammar::W( "; " )) + tr;

      PutLine( grammar::U8( next.surfaceForm + grammar::W( "\t" )
        + next.syllabicForm + grammar::W( "\t" )
        + next.acousticForm + grammar::W( "\t" )
        + next.partOfSpeech + grammar::W( "\t" )
        + translated ) );
    }
  }

 /*
  * PosDistribution( records )
  *
  * Counts by part of speech, most frequent first; equal counts keep the
  * order of first appearance.
  */
  auto  Processor::PosDistribution( const std::vector<WordInfo>& records ) -> std::vector<PosCount>
  {
    auto  counts = std::vector<PosCount>();

    for ( auto& next: records )
    {
      auto  pfound = std::find_if( counts.begin(), counts.end(), [&]( const PosCount& pc )
        {  return pc.first == next.partOfSpeech;  } );

      if ( pfound == counts.end() )
        counts.emplace_back( next.partOfSpeech, 1 );
      else
        ++pfound->second;
    }

    std::stable_sort( counts.begin(), counts.end(), []( const PosCount& a, const PosCount& b )
      {  return a.second > b.second;  } );

    return counts;
  }

}}
