// Angle conversion constants used by jwgeom; all angles are converted to
// radians internally unless a field says otherwise.
#ifndef ASTROCONST_H
#define ASTROCONST_H

#ifndef PI
#define PI 3.14159265358979323
#endif

const double  DEGREE	    = PI/180.;               // One degree, in rad
const double  ARCMIN	    = PI/180./60.;
const double  ARCSEC	    = PI/180./3600.;
const double  MILLIARCSEC   = 0.001*ARCSEC;
const double  RadToArcsec   = 3600.*180./PI;

#endif  // ASTROCONST_H
