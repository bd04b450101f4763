# include "../morphology.hpp"
# include "../grammar/phonology.hpp"

namespace navimorph {

  Morphology::Morphology( const lexicon::ExceptionIndex& except, const Trace::Func& trace ):
    lemmatizer( except ),
    traceFunc( trace )  {}

  template <class Action>
  auto  Morphology::Traced( const char* method, const std::string& args, Action action ) const -> decltype(std::declval<Action>()())
  {
    Report( traceFunc, Trace::Level::debug, "%s( %s )", method, args.c_str() );

    try
    {
      return action();
    }
    catch ( const std::exception& x )
    {
      Report( traceFunc, Trace::Level::error, "%s( %s ): %s", method, args.c_str(), x.what() );
      throw;
    }
  }

  auto  Morphology::Lemmatize( const mtc::widestr& word ) const -> mtc::widestr
  {
    return Traced( "Lemmatize", "'" + std::string( grammar::U8( word ) ) + "'", [&]()
      {  return lemmatizer.Lemmatize( word );  } );
  }

  auto  Morphology::Lemmatize( const mtc::zval& word ) const -> mtc::widestr
  {
    return Traced( "Lemmatize", word.get_type() == mtc::zval::z_charstr ? "'" + std::string( *word.get_charstr() ) + "'" : "zval", [&]()
      {  return lemmatizer.Lemmatize( word );  } );
  }

  auto  Morphology::Lemmatize( const std::string_view& word, unsigned codepage ) const -> mtc::charstr
  {
    auto  wide = codepages::mbcstowide( codepage, std::string( word ).c_str() );

    return codepages::widetombcs( codepage, Lemmatize( wide ) );
  }

  auto  Morphology::Generate( Category category, const mtc::widestr& lemma, const mtc::zmap& features ) const -> std::vector<mtc::widestr>
  {
    return Traced( "Generate", mtc::strprintf( "%s, '%s'", grammar::ToString( category ), grammar::U8( lemma ).c_str() ), [&]()
      {  return grammar::WordForm::Create( category, lemma, features ).Inflect( features );  } );
  }

  auto  Morphology::Generate( const std::string_view& category, const std::string_view& lemma, const mtc::zmap& features ) const -> std::vector<mtc::charstr>
  {
    auto  output = std::vector<mtc::charstr>();
    auto  ucateg = Traced( "Generate", std::string( category ), [&]()
      {  return grammar::FromString<Category>( category );  } );

    for ( auto& next: Generate( ucateg, grammar::W( std::string( lemma ).c_str() ), features ) )
      output.push_back( grammar::U8( next ) );

    return output;
  }

}
