# include "../../grammar/particle.hpp"

namespace navimorph {
namespace grammar {

  Particle::Particle( const mtc::widestr& str, ParticleType pty ):
    lemma( str ),
    ptype( pty ) {}

  auto  Particle::UseInContext( const mtc::widestr& context ) const -> mtc::widestr
  {
    switch ( ptype )
    {
      case ParticleType::question:
        return lemma + W( " " ) + context;
      case ParticleType::vocative:
        return W( "ma " ) + context;
      case ParticleType::negative:
      case ParticleType::general:
        return context + W( " " ) + lemma;
      default:
        throw UnknownCategoryOrFeature( "unknown particle type" );
    }
  }

}}
