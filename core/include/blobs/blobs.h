#pragma once

// Blobs - Main header
// Oscillator-modulated particle flock with macro record/replay

#include <blobs/blob.h>
#include <blobs/color.h>
#include <blobs/draw_surface.h>
#include <blobs/flock.h>
#include <blobs/input.h>
#include <blobs/lfo.h>
#include <blobs/macro.h>
#include <blobs/macro_catalog.h>
#include <blobs/macro_recording.h>
#include <blobs/settings.h>
#include <blobs/simulation.h>
