# include "../context/processor.hpp"
# include "../grammar/phonology.hpp"
# include "../morphology.hpp"
# include "../config.hpp"
# include <mtc/wcsstr.h>
# include <cstring>
# include <cerrno>
# include <cstdio>

using namespace navimorph;

auto  LoadLexicon( const Config& config, const Trace::Func& trace ) -> mtc::api<lexicon::ILexicon>
{
  if ( config.lexicon.path.empty() )
    return nullptr;

  if ( config.lexicon.type == "json" )
    return lexicon::LoadJsonLexicon( config.lexicon.path, trace );
  return lexicon::LoadTsvLexicon( config.lexicon.path, trace );
}

auto  LoadExceptions( const Config& config, const Trace::Func& trace ) -> lexicon::ExceptionIndex
{
  if ( config.exceptions.empty() )
    return {};

  return lexicon::LoadExceptions( lexicon::OpenExceptions( config.exceptions, trace ).ptr(), trace );
}

int   Lemmatize( const Morphology& morph, char* words[], int count )
{
  for ( int i = 0; i != count; ++i )
    fprintf( stdout, "%s\t%s\n", words[i], morph.Lemmatize( std::string_view( words[i] ) ).c_str() );
  return 0;
}

int   Syllables( char* words[], int count )
{
  for ( int i = 0; i != count; ++i )
  {
    auto  syllab = grammar::Syllabify( grammar::ToLower( grammar::W( words[i] ) ) );
    auto  output = mtc::widestr();

    for ( auto& next: syllab )
      output += (output.empty() ? mtc::widestr() : grammar::W( "-" )) + next;

    fprintf( stdout, "%s\t%s\n", words[i], grammar::U8( output ).c_str() );
  }
  return 0;
}

int   Generate( const Morphology& morph, char* args[], int count )
{
  auto  features = mtc::zmap();

  if ( count < 2 )
    return fprintf( stderr, "generate: category and lemma expected\n" ), EINVAL;

  for ( int i = 2; i < count; ++i )
  {
    auto  pequal = strchr( args[i], '=' );

    if ( pequal == nullptr || pequal == args[i] )
      return fprintf( stderr, "generate: invalid feature '%s', key=value expected\n", args[i] ), EINVAL;

    features.set_charstr( std::string( args[i], pequal - args[i] ).c_str(), pequal + 1 );
  }

  for ( auto& next: morph.Generate( args[0], args[1], features ) )
    fprintf( stdout, "%s\n", next.c_str() );

  return 0;
}

int   Parse( const Morphology& morph, const Config& config, const Trace::Func& trace, char* words[], int count )
{
  auto  sentence = mtc::widestr();
  auto  records = std::vector<context::Processor::WordInfo>();
  auto  output = stdout;

  for ( int i = 0; i != count; ++i )
    sentence += (sentence.empty() ? mtc::widestr() : grammar::W( " " )) + grammar::W( words[i] );

  records = context::Processor( morph.GetLemmatizer(), LoadLexicon( config, trace ), trace )
    .ParseSentence( sentence );

  if ( records.empty() )
    return fprintf( stdout, "No results to save.\n" ), 0;

  if ( !config.output.empty() && (output = fopen( config.output.c_str(), "w" )) == nullptr )
  {
    return fprintf( stderr, "could not create file '%s', error %d (%s)\n",
      config.output.c_str(), errno, strerror( errno ) ), EIO;
  }

  context::Processor::SaveResults( output, records );

  if ( output != stdout )
  {
    fclose( output );
    Report( trace, Trace::Level::info, "results saved to '%s'", config.output.c_str() );
  }
    else
  fputc( '\n', stdout );

  for ( auto& next: context::Processor::PosDistribution( records ) )
    fprintf( stdout, "%s\t%u\n", grammar::U8( next.first ).c_str(), unsigned(next.second) );

  return 0;
}

const char about[] = "navi-morph - lemmatize and inflect Na'vi words\n"
  "usage: %s [options] command arguments...\n"
  "commands are:\n"
  "\t" "lemmatize WORD... - print the lemma of each word\n"
  "\t" "generate CATEGORY LEMMA [key=value...] - print inflected forms\n"
  "\t" "parse SENTENCE - print lexicon records for each word of the sentence\n"
  "\t" "syllables WORD... - print syllables of each word\n"
  "options are:\n"
  "\t" "-config:PATH - json configuration file;\n"
  "\t" "-o:PATH - output file for 'parse' results.\n";

int   main( int argc, char* argv[] )
{
  auto  config = Config();
  auto  output = (const char*)nullptr;
  int   nfirst = 1;

  for ( ; nfirst < argc && *argv[nfirst] == '-'; ++nfirst )
  {
    if ( strncmp( argv[nfirst], "-config:", 8 ) == 0
      || strncmp( argv[nfirst], "-config=", 8 ) == 0 )
    {
      try
      {
        config = LoadConfig( std::string( argv[nfirst] + 8 ) );
      }
      catch ( const std::exception& x )
      {
        return fprintf( stderr, "could not load config '%s': %s\n", argv[nfirst] + 8, x.what() ), EINVAL;
      }
    }
      else
    if ( strncmp( argv[nfirst], "-o:", 3 ) == 0
      || strncmp( argv[nfirst], "-o=", 3 ) == 0 )
    {
      output = argv[nfirst] + 3;
    }
      else
    return fprintf( stderr, "Unknown option '%s'\n", argv[nfirst] ), EINVAL;
  }

  if ( output != nullptr )
    config.output = output;

  if ( nfirst >= argc )
    return fprintf( stdout, about, argv[0] ), 0;

  try
  {
    auto  command = argv[nfirst++];
    auto  trace = Trace::Stderr( config.logLevel );
    auto  morph = Morphology( LoadExceptions( config, trace ), trace );

    if ( strcmp( command, "lemmatize" ) == 0 )
      return Lemmatize( morph, argv + nfirst, argc - nfirst );
    if ( strcmp( command, "generate" ) == 0 )
      return Generate( morph, argv + nfirst, argc - nfirst );
    if ( strcmp( command, "parse" ) == 0 )
      return Parse( morph, config, trace, argv + nfirst, argc - nfirst );
    if ( strcmp( command, "syllables" ) == 0 )
      return Syllables( argv + nfirst, argc - nfirst );

    return fprintf( stderr, "Unknown command '%s'\n", command ), EINVAL;
  }
  catch ( const std::invalid_argument& x )
  {
    return fprintf( stderr, "%s\n", x.what() ), EINVAL;
  }
  catch ( const std::exception& x )
  {
    return fprintf( stderr, "%s\n", x.what() ), EFAULT;
  }
}
