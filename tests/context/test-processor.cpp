# include "../../context/processor.hpp"
# include "../../grammar/phonology.hpp"
# include "../toolbox/tmppath.h"
# include <mtc/test-it-easy.hpp>
# include <cstdio>

using namespace navimorph;
using grammar::W;

static  auto  ReadTmpFile( const std::string& path ) -> std::string
{
  auto  infile = fopen( path.c_str(), "rb" );
  auto  output = std::string();
  char  buffer[0x400];

  if ( infile != nullptr )
  {
    for ( size_t cbread; (cbread = fread( buffer, 1, sizeof(buffer), infile )) != 0; )
      output.append( buffer, cbread );
    fclose( infile );
  }
  return output;
}

TestItEasy::RegisterFunc  test_processor( []()
{
  TEST_CASE( "context/processor" )
  {
    auto  lexicon = lexicon::CreateLexicon( {
      { W( "oe" ), W( "o.e" ), {}, W( "pn." ), { W( "I" ), W( "me" ) } },
      { W( "nga" ), {}, {}, W( "pn." ), { W( "you" ) } },
      { W( "kame" ), W( "ka.me" ), {}, W( "vtr." ), { W( "see" ) } },
      { W( "tsmukan" ), {}, {}, W( "n." ), { W( "brother" ) } } } );
    auto  lemmas = context::Lemmatizer( lexicon::ExceptionIndex()
      .Add( W( "oe" ), { W( "oel" ) } )
      .Add( W( "nga" ), { W( "ngati" ) } ) );
    auto  txProc = context::Processor( lemmas, lexicon );

    SECTION( "Tokenize() splits by blanks and strips punctuation" )
    {
      auto  tokens = context::Processor::Tokenize( W( "Oel ngati kameie, ma tsmukan!" ) );

      if ( REQUIRE( tokens.size() == 5 ) )
      {
        REQUIRE( tokens[0] == W( "Oel" ) );
        REQUIRE( tokens[1] == W( "ngati" ) );
        REQUIRE( tokens[2] == W( "kameie" ) );
        REQUIRE( tokens[3] == W( "ma" ) );
        REQUIRE( tokens[4] == W( "tsmukan" ) );
      }
      SECTION( "* punctuation-only tokens are dropped" )
        {  REQUIRE( context::Processor::Tokenize( W( "  ?! kaltxì .\t" ) ).size() == 1 );  }
      SECTION( "* inner punctuation is kept" )
        {  REQUIRE( context::Processor::Tokenize( W( "...'a.w..." ) )[0] == W( "'a.w" ) );  }
      SECTION( "* empty string gives no tokens" )
        {  REQUIRE( context::Processor::Tokenize( {} ).empty() );  }
    }
    SECTION( "GetWordInfo() looks the lemma up" )
    {
      auto  record = txProc.GetWordInfo( W( "Kameie" ) );

      REQUIRE( record.surfaceForm == W( "kame" ) );
      REQUIRE( record.syllabicForm == W( "ka.me" ) );
      REQUIRE( record.partOfSpeech == W( "vtr." ) );

      SECTION( "* unknown words keep the original text" )
      {
        record = txProc.GetWordInfo( W( "Ikranä" ) );

        REQUIRE( record.surfaceForm == W( "Ikranä" ) );
        REQUIRE( record.partOfSpeech == W( "unknown" ) );
        REQUIRE( record.translations.empty() );
      }
      SECTION( "* processor without lexicon finds nothing" )
        {  REQUIRE( context::Processor( lemmas ).GetWordInfo( W( "kame" ) ).partOfSpeech == W( "unknown" ) );  }
    }
    SECTION( "ParseSentence() gives a record per token" )
    {
      auto  parsed = txProc.ParseSentence( W( "Oel ngati kameie, ma tsmukan!" ) );

      if ( REQUIRE( parsed.size() == 5 ) )
      {
        REQUIRE( parsed[0].surfaceForm == W( "oe" ) );
        REQUIRE( parsed[1].surfaceForm == W( "nga" ) );
        REQUIRE( parsed[2].surfaceForm == W( "kame" ) );
        REQUIRE( parsed[3].partOfSpeech == W( "unknown" ) );
        REQUIRE( parsed[4].translations[0] == W( "brother" ) );
      }
      SECTION( "* PosDistribution() counts parts of speech" )
      {
        auto  counts = context::Processor::PosDistribution( parsed );

        if ( REQUIRE( counts.size() == 4 ) )
        {
          REQUIRE( counts[0].first == W( "pn." ) );
          REQUIRE( counts[0].second == 2 );
          REQUIRE( counts[1].first == W( "vtr." ) );
          REQUIRE( counts[3].first == W( "n." ) );
        }
      }
      SECTION( "* SaveResults() writes tab-separated table" )
      {
        auto  path = GetTmpPath() + "navimorph-results.tsv";
        auto  file = fopen( path.c_str(), "wb" );

        if ( REQUIRE( file != nullptr ) )
        {
          REQUIRE_NOTHROW( context::Processor::SaveResults( file, { parsed[0], parsed[3] } ) );
          fclose( file );

          REQUIRE( ReadTmpFile( path ) ==
            "navi\tsyllabic\tacoustic\tpos\ttranslations\n"
            "oe\to.e\t\tpn.\tI; me\n"
            "ma\t\t\tunknown\t\n" );
        }
        remove( path.c_str() );
      }
    }
  }
} );
