// Copyright 2024 Global Phasing Ltd.

#ifndef FFPARM_VERSION_HPP_
#define FFPARM_VERSION_HPP_

#define FFPARM_VERSION "0.1.0"

#endif
