// This file is a derived work from random kit by Robert Kern.
/*
# The kernels for distributions are based on
# numpy/random/mtrand/distributions.c
# with the following licenses:
*/

/* Copyright 2005 Robert Kern (robert.kern@gmail.com)
 *
 * Permission is hereby granted, free of charge, to any person obtaining a
 * copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS
 * OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
 * IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY
 * CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,
 * TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE
 * SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

/* Copyright 2023 NVIDIA Corporation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 */

#pragma once

#include "cusample/random/randutil/randutil_curand.h"

// Scalar samplers over a single curand state. rk_uniform returns values in (0, 1].

template <typename rk_state>
RANDUTIL_QUALIFIERS double rk_uniform(rk_state* state)
{
  return curand_uniform_double(state);
}

template <typename rk_state>
RANDUTIL_QUALIFIERS double rk_gauss(rk_state* state)
{
  return curand_normal_double(state);
}

template <typename rk_state>
RANDUTIL_QUALIFIERS double rk_standard_exponential(rk_state* state)
{
  return -log(rk_uniform(state));
}

// Marsaglia and Tsang for shape >= 1; shape < 1 boosts a draw with shape + 1
template <typename rk_state>
RANDUTIL_QUALIFIERS double rk_standard_gamma(rk_state* state, double shape)
{
  if (shape == 1.0) return rk_standard_exponential(state);

  double boost = 1.0;
  if (shape < 1.0) {
    boost = pow(rk_uniform(state), 1.0 / shape);
    shape += 1.0;
  }

  const double d = shape - 1.0 / 3.0;
  const double c = 1.0 / sqrt(9.0 * d);
  for (;;) {
    double x, v;
    do {
      x = rk_gauss(state);
      v = 1.0 + c * x;
    } while (v <= 0.0);
    v = v * v * v;
    const double u = rk_uniform(state);
    if (u < 1.0 - 0.0331 * (x * x) * (x * x)) return boost * d * v;
    if (log(u) < 0.5 * x * x + d * (1.0 - v + log(v))) return boost * d * v;
  }
}

template <typename rk_state>
RANDUTIL_QUALIFIERS double rk_beta(rk_state* state, double a, double b)
{
  if ((a <= 1.0) && (b <= 1.0)) {
    // Johnk's algorithm
    for (;;) {
      const double u = rk_uniform(state);
      const double v = rk_uniform(state);
      const double x = pow(u, 1.0 / a);
      const double y = pow(v, 1.0 / b);
      if ((x + y) <= 1.0) {
        if (x + y > 0.0) return x / (x + y);
        // both powers underflowed, redo the ratio in log space
        double log_x     = log(u) / a;
        double log_y     = log(v) / b;
        const double top = log_x > log_y ? log_x : log_y;
        log_x -= top;
        log_y -= top;
        return exp(log_x - log(exp(log_x) + exp(log_y)));
      }
    }
  }
  const double ga = rk_standard_gamma(state, a);
  const double gb = rk_standard_gamma(state, b);
  return ga / (ga + gb);
}
