#ifndef GROWTH_FIT_HPP
#define GROWTH_FIT_HPP

// Include all library headers here
#include "analysis_config.hpp"
#include "curve_sampler.hpp"
#include "death_phase_detector.hpp"
#include "growth_analysis.hpp"
#include "growth_data.hpp"
#include "logistic_fitter.hpp"
#include "logistic_model.hpp"
#include "report_writer.hpp"
#include "series_builder.hpp"

// This is the main header file for the growth_fit library
// Include this single header to access all functionality

#endif // GROWTH_FIT_HPP
