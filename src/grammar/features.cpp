# include "../../grammar/features.hpp"
# include <mtc/wcsstr.h>
# include <cstdlib>
# include <cstring>
# include <limits>

namespace navimorph {
namespace grammar {

  static const char* categoryNames[] = { "noun", "pronoun", "verb", "adjective", "number", "particle", "prenoun" };
  static const char* caseNames[] = { "subjective", "agentive", "patientive", "dative", "genitive", "topical" };
  static const char* numberNames[] = { "singular", "dual", "trial", "plural" };
  static const char* personNames[] = { "first", "second", "third" };
  static const char* animacyNames[] = { "animate", "inanimate" };
  static const char* inclusivityNames[] = { "exclusive", "inclusive" };
  static const char* genderNames[] = { "neutral", "male", "female" };
  static const char* registerNames[] = { "full", "short" };
  static const char* pronounKindNames[] = { "personal", "reflexive", "indeterminate" };
  static const char* voiceNames[] = { "active", "passive" };
  static const char* transitivityNames[] = { "transitive", "intransitive" };
  static const char* positionNames[] = { "before", "after" };
  static const char* comparisonNames[] = { "standard", "superlative", "equality" };
  static const char* particleTypeNames[] = { "general", "question", "vocative", "negative" };
  static const char* prenounTypeNames[] = { "deictic", "question", "universal" };

  template <class E, size_t N>
  static  auto  FindName( const std::string_view& name, const char* (&names)[N], const char* what ) -> E
  {
    for ( size_t i = 0; i != N; ++i )
      if ( name == names[i] )
        return E(i);

    throw UnknownCategoryOrFeature( mtc::strprintf( "unknown %s '%s'", what,
      std::string( name ).c_str() ) );
  }

  template <class E, size_t N>
  static  auto  GetName( E value, const char* (&names)[N] ) -> const char*
  {
    if ( unsigned(value) >= N )
      throw UnknownCategoryOrFeature( "feature value out of range" );
    return names[unsigned(value)];
  }

  template <> auto  FromString<Category>( const std::string_view& s ) -> Category
    {  return FindName<Category>( s, categoryNames, "category" );  }
  template <> auto  FromString<Case>( const std::string_view& s ) -> Case
    {  return FindName<Case>( s, caseNames, "case" );  }
  template <> auto  FromString<Number>( const std::string_view& s ) -> Number
    {  return FindName<Number>( s, numberNames, "number" );  }
  template <> auto  FromString<Person>( const std::string_view& s ) -> Person
    {  return FindName<Person>( s, personNames, "person" );  }
  template <> auto  FromString<Animacy>( const std::string_view& s ) -> Animacy
    {  return FindName<Animacy>( s, animacyNames, "animacy" );  }
  template <> auto  FromString<Inclusivity>( const std::string_view& s ) -> Inclusivity
    {  return FindName<Inclusivity>( s, inclusivityNames, "inclusivity" );  }
  template <> auto  FromString<Register>( const std::string_view& s ) -> Register
    {  return FindName<Register>( s, registerNames, "register" );  }
  template <> auto  FromString<PronounKind>( const std::string_view& s ) -> PronounKind
    {  return FindName<PronounKind>( s, pronounKindNames, "pronoun kind" );  }
  template <> auto  FromString<Voice>( const std::string_view& s ) -> Voice
    {  return FindName<Voice>( s, voiceNames, "voice" );  }
  template <> auto  FromString<Transitivity>( const std::string_view& s ) -> Transitivity
    {  return FindName<Transitivity>( s, transitivityNames, "transitivity" );  }
  template <> auto  FromString<Position>( const std::string_view& s ) -> Position
    {  return FindName<Position>( s, positionNames, "position" );  }
  template <> auto  FromString<Comparison>( const std::string_view& s ) -> Comparison
    {  return FindName<Comparison>( s, comparisonNames, "comparison" );  }
  template <> auto  FromString<ParticleType>( const std::string_view& s ) -> ParticleType
    {  return FindName<ParticleType>( s, particleTypeNames, "particle type" );  }
  template <> auto  FromString<PrenounType>( const std::string_view& s ) -> PrenounType
    {  return FindName<PrenounType>( s, prenounTypeNames, "prenoun type" );  }

  // question words call the unmarked gender 'common'
  template <> auto  FromString<Gender>( const std::string_view& s ) -> Gender
    {  return s == "common" ? Gender::neutral : FindName<Gender>( s, genderNames, "gender" );  }

  auto  ToString( Category v ) -> const char*  {  return GetName( v, categoryNames );  }
  auto  ToString( Case v ) -> const char*      {  return GetName( v, caseNames );  }
  auto  ToString( Number v ) -> const char*    {  return GetName( v, numberNames );  }
  auto  ToString( Person v ) -> const char*    {  return GetName( v, personNames );  }
  auto  ToString( Gender v ) -> const char*    {  return GetName( v, genderNames );  }
  auto  ToString( Register v ) -> const char*  {  return GetName( v, registerNames );  }

  // FeatureSet implementation

  FeatureSet::FeatureSet( const mtc::zmap& features, const std::vector<const char*>& allowed ):
    values( features )
  {
    for ( auto& next: values )
    {
      bool  bfound = false;

      if ( !next.first.is_charstr() )
        throw UnknownCategoryOrFeature( "feature keys have to be strings" );

      for ( auto keystr: allowed )
        if ( (bfound = strcmp( next.first.to_charstr(), keystr ) == 0) == true )
          break;

      if ( !bfound )
      {
        throw UnknownCategoryOrFeature( mtc::strprintf( "unexpected feature '%s'",
          next.first.to_charstr() ) );
      }
    }
  }

  bool  FeatureSet::Has( const char* key ) const
  {
    return values.get( key ) != nullptr;
  }

  auto  FeatureSet::GetString( const char* key ) const -> mtc::widestr
  {
    auto  pval = values.get( key );

    if ( pval == nullptr )
      return {};

    switch ( pval->get_type() )
    {
      case mtc::zval::z_charstr:
        return codepages::mbcstowide( codepages::codepage_utf8, *pval->get_charstr() );
      case mtc::zval::z_widestr:
        return *pval->get_widestr();
      default:
        throw UnknownCategoryOrFeature( mtc::strprintf( "feature '%s' has to be string", key ) );
    }
  }

  template <class I>
  static  auto  GetUnsigned( I i, const char* key ) -> unsigned
  {
    if ( double(i) < 0 || double(i) > std::numeric_limits<unsigned>::max() )
      throw UnknownCategoryOrFeature( mtc::strprintf( "feature '%s' value out of range", key ) );
    return unsigned(i);
  }

  auto  FeatureSet::GetUnsigned( const char* key, unsigned defval ) const -> unsigned
  {
    auto  pval = values.get( key );

    if ( pval == nullptr )
      return defval;

    switch ( pval->get_type() )
    {
      case mtc::zval::z_word16:   return grammar::GetUnsigned( *pval->get_word16(), key );
      case mtc::zval::z_word32:   return grammar::GetUnsigned( *pval->get_word32(), key );
      case mtc::zval::z_word64:   return grammar::GetUnsigned( *pval->get_word64(), key );
      case mtc::zval::z_int16:    return grammar::GetUnsigned( *pval->get_int16(), key );
      case mtc::zval::z_int32:    return grammar::GetUnsigned( *pval->get_int32(), key );
      case mtc::zval::z_int64:    return grammar::GetUnsigned( *pval->get_int64(), key );
      case mtc::zval::z_charstr:
        {
          auto  strval = pval->get_charstr()->c_str();
          char* strend;
          auto  uvalue = strtoul( strval, &strend, 10 );

          if ( *strval == '\0' || *strval == '-' || *strend != '\0' )
            throw UnknownCategoryOrFeature( mtc::strprintf( "feature '%s' has to be integer", key ) );
          return grammar::GetUnsigned( uvalue, key );
        }
      default:
        throw UnknownCategoryOrFeature( mtc::strprintf( "feature '%s' has to be integer", key ) );
    }
  }

  bool  FeatureSet::GetBool( const char* key, bool defval ) const
  {
    auto  pval = values.get( key );

    if ( pval == nullptr )
      return defval;

    if ( pval->get_type() == mtc::zval::z_charstr || pval->get_type() == mtc::zval::z_widestr )
    {
      auto  valstr = GetName( key, *pval );

      if ( valstr == "true" || valstr == "on" || valstr == "yes" || valstr == "1" )
        return true;
      if ( valstr == "false" || valstr == "off" || valstr == "no" || valstr == "0" )
        return false;
      throw UnknownCategoryOrFeature( mtc::strprintf( "invalid boolean feature '%s' value '%s'",
        key, valstr.c_str() ) );
    }
    return GetUnsigned( key, 0 ) != 0;
  }

  auto  FeatureSet::GetName( const char* key, const mtc::zval& zv ) -> std::string
  {
    switch ( zv.get_type() )
    {
      case mtc::zval::z_charstr:
        return *zv.get_charstr();
      case mtc::zval::z_widestr:
        return codepages::widetombcs( codepages::codepage_utf8, *zv.get_widestr() );
      default:
        throw UnknownCategoryOrFeature( mtc::strprintf( "feature '%s' has to be string", key ) );
    }
  }

}}
