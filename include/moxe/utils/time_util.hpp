/*
 * time_util.hpp
 *
 *  Created on: Sep 18, 2026
 */

#ifndef MOXE_UTILS_TIME_UTIL_HPP_
#define MOXE_UTILS_TIME_UTIL_HPP_

#include <string>

double getTime();
std::string formatTime(double seconds, int precision = 0);

#endif /* MOXE_UTILS_TIME_UTIL_HPP_ */
