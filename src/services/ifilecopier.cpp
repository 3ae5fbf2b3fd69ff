/**
 * @file ifilecopier.cpp
 * @brief Implementation file for IFileCopier interface.
 *
 * The interface is header-only; this file gives AUTOMOC a translation unit
 * to attach the generated signal code to.
 */

#include "ifilecopier.h"
