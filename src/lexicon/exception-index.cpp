# include "../../lexicon/exception-index.hpp"
# include "../../compat.hpp"
# include "load-file.hpp"
# include <mtc/exceptions.h>

namespace navimorph {
namespace lexicon {

  // ExceptionIndex implementation

  auto  ExceptionIndex::Add( const mtc::widestr& lemma, const std::vector<mtc::widestr>& forms ) -> ExceptionIndex&
  {
    auto& entry = entries.emplace_back();

    entry.lemma = lemma;
    entry.lower = codepages::strtolower( lemma );

    for ( auto& next: forms )
      entry.forms.insert( codepages::strtolower( next ) );

    return *this;
  }

  auto  ExceptionIndex::Find( const mtc::widestr& word ) const -> const mtc::widestr*
  {
    for ( auto& entry: entries )
      if ( word == entry.lower || entry.forms.find( word ) != entry.forms.end() )
        return &entry.lemma;
    return nullptr;
  }

  // load helpers

  static  auto  GetLemma( const mtc::zmap::key& key ) -> mtc::widestr
  {
    if ( key.is_charstr() )
      return codepages::mbcstowide( codepages::codepage_utf8, key.to_charstr() );
    if ( key.is_widestr() )
      return key.to_widestr();
    throw std::invalid_argument( "exception lemma has to be string" );
  }

  static  auto  GetForms( const mtc::zval& value ) -> std::vector<mtc::widestr>
  {
    std::vector<mtc::widestr> forms;

    switch ( value.get_type() )
    {
      case mtc::zval::z_array_charstr:
        for ( auto& next: *value.get_array_charstr() )
          forms.push_back( codepages::mbcstowide( codepages::codepage_utf8, next ) );
        break;
      case mtc::zval::z_array_widestr:
        for ( auto& next: *value.get_array_widestr() )
          forms.push_back( next );
        break;
      case mtc::zval::z_array_zval:
        for ( auto& next: *value.get_array_zval() )
          forms.push_back( GetWideStr( next ) );
        break;
      default:
        throw std::invalid_argument( "exception forms have to be array of strings" );
    }
    return forms;
  }

  auto  LoadExceptions( const mtc::zmap& table, const Trace::Func& trace ) -> ExceptionIndex
  {
    ExceptionIndex  except;

    for ( auto& next: table )
    {
      try
      {
        except.Add( GetLemma( next.first ), GetForms( next.second ) );
      }
      catch ( const std::invalid_argument& x )
      {
        Report( trace, Trace::Level::warning, "exception entry skipped: %s", x.what() );
      }
    }

    return except;
  }

  auto  LoadExceptions( IExceptionSource* source, const Trace::Func& trace ) -> ExceptionIndex
  {
    if ( source == nullptr )
      return {};

    try
    {
      return source->Load();
    }
    catch ( const MalformedExceptionData& x )
    {
      Report( trace, Trace::Level::warning, "exception table ignored, %s", x.what() );
      return {};
    }
  }

  // json file source

  class JsonExceptionSource final: public IExceptionSource
  {
    implement_lifetime_control

  public:
    JsonExceptionSource( const std::string& path, const Trace::Func& func ):
      source( path ),
      tracer( func ) {}

    auto  Load() -> ExceptionIndex override;

  protected:
    std::string source;
    Trace::Func tracer;

  };

  auto  JsonExceptionSource::Load() -> ExceptionIndex
  {
    mtc::zval parsed;

    if ( access( source.c_str(), F_OK ) != 0 )
    {
      Report( tracer, Trace::Level::info, "no exceptions file found at '%s'", source.c_str() );
      return {};
    }

    try
    {
      parsed = ParseJson( ReadFile( source ) );
    }
    catch ( const mtc::file_error& x )
    {
      throw MalformedExceptionData( x.what() );
    }
    catch ( const std::invalid_argument& x )
    {
      throw MalformedExceptionData( mtc::strprintf( "'%s' is not valid json or is empty: %s",
        source.c_str(), x.what() ) );
    }

    if ( parsed.get_type() != mtc::zval::z_zmap )
    {
      throw MalformedExceptionData( mtc::strprintf( "'%s' has to contain json object",
        source.c_str() ) );
    }

    return LoadExceptions( *parsed.get_zmap(), tracer );
  }

  auto  OpenExceptions( const std::string& path, const Trace::Func& trace ) -> mtc::api<IExceptionSource>
  {
    return new JsonExceptionSource( path, trace );
  }

}}
