# if !defined( __navimorph_grammar_particle_hpp__ )
# define __navimorph_grammar_particle_hpp__
# include "phonology.hpp"
# include "features.hpp"

namespace navimorph {
namespace grammar {

  class Particle
  {
  public:
    Particle( const mtc::widestr&, ParticleType = ParticleType::general );

  public:
    auto  GetLemma() const -> const mtc::widestr&  {  return lemma;  }
    auto  GetType() const -> ParticleType  {  return ptype;  }

    bool  IsQuestion() const  {  return ptype == ParticleType::question;  }
    bool  IsVocative() const  {  return ptype == ParticleType::vocative;  }

  public:
    auto  UseInContext( const mtc::widestr& ) const -> mtc::widestr;

  protected:
    mtc::widestr  lemma;
    ParticleType  ptype;

  };

}}

# endif   // !__navimorph_grammar_particle_hpp__
