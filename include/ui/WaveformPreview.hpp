#pragma once
/** @file  WaveformPreview.hpp
 *  @brief Canned sine-plus-noise trace for the live graph (no acquisition involved).
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace dcbench {
  namespace ui {

    /**
 * @class WaveformPreview
 * @brief Each `nextFrame()` returns one screen of samples, shifted a little
 *        so the trace appears to scroll.
 */
    class WaveformPreview {
    public:
      struct Settings {
        double amplitude{ 5.0 };    ///< peak, V
        double cycles{ 2.0 };       ///< periods per frame
        std::size_t samples{ 120 }; ///< points per frame
        double noise{ 0.05 };       ///< σ of injected noise, fraction of amplitude
        double scroll{ 0.25 };      ///< phase advance per frame, rad
        std::uint32_t seed{ 1 };
      };

      explicit WaveformPreview(Settings settings);

      std::vector<double> nextFrame();

      void setAmplitude(double volts) { settings_.amplitude = volts; }

      /// Peak to draw for the form text \p raw; \p fallback unless it is a finite positive number.
      static double amplitudeFor(const std::string& raw, double fallback);
      const Settings& settings() const { return settings_; }

      /**
       * @brief ASCII strip chart, \p rows lines of \p cols characters.
       *
       * @param fullScale  Value drawn on the top row (and its negative on the bottom).
       *                   Non-finite samples are left out.
       */
      static std::string render(const std::vector<double>& frame, double fullScale, int rows,
                                int cols);

    private:
      Settings settings_;
      double phase_{ 0.0 };
      std::mt19937 rng_;
    };

  } // namespace ui
} // namespace dcbench
