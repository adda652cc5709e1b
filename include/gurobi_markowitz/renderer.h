#pragma once
/*
===============================================================================
RENDERER — Text charts of the frontier and its allocations
===============================================================================

OVERVIEW
--------
Everything is drawn with characters on an std::ostream so a frontier run
needs nothing beyond a terminal:

    renderMarketTable()          asset, mu_i, sqrt(Sigma_ii)
    renderFrontier()             risk (x) vs return (y): the frontier curve,
                                 single-asset portfolios and marked samples
    renderAllocations()          one stacked bar per marked sample, one glyph
                                 (and optionally one ANSI colour) per asset
    renderReturnDistributions()  N(mu'w, w'Sigma w) densities of the marked
                                 portfolios on a shared axis
    writeFrontierCsv()           gamma, return, risk, weights per sample

Glyphs
------
    renderFrontier       *  frontier     o  single asset     @  marked sample
    renderAllocations    #  %  =  +  :  ~  o  x  -  .   (cycled per asset)

EXCEPTION SAFETY
----------------
• Marked sample indices outside [0, frontier.size()) throw std::out_of_range
  (checkSampleIndices(), also run by every chart that takes markers)
• Label count different from the asset count: std::invalid_argument

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <numbers>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "frontier.h"
#include "market_data.h"
#include "naming.h"

namespace markowitz {

    struct RenderOptions {
        int width = 64;         ///< Plot columns
        int height = 20;        ///< Plot rows
        bool useColor = false;  ///< ANSI colours in allocation bars
    };

    /// @throws std::out_of_range for an index outside [0, frontier.size())
    inline void checkSampleIndices(const Frontier& frontier, const std::vector<int>& markers) {
        for (int k : markers) {
            if (k < 0 || k >= frontier.size()) {
                throw std::out_of_range(
                    std::format("checkSampleIndices: sample {} out of range [0, {})",
                                k, frontier.size()));
            }
        }
    }

    namespace render_detail {

        inline constexpr char kAllocGlyphs[] = { '#', '%', '=', '+', ':', '~', 'o', 'x', '-', '.' };
        inline constexpr int kAllocGlyphCount = static_cast<int>(sizeof(kAllocGlyphs));

        inline char allocGlyph(int asset) {
            return kAllocGlyphs[asset % kAllocGlyphCount];
        }

        /// ANSI 31..36 then bright 91..96
        inline std::string colored(char glyph, int asset, bool useColor) {
            if (!useColor) return std::string(1, glyph);
            const int slot = asset % 12;
            const int code = slot < 6 ? 31 + slot : 91 + (slot - 6);
            return std::format("\x1b[{}m{}\x1b[0m", code, glyph);
        }

        inline void checkOptions(const RenderOptions& o) {
            if (o.width < 8 || o.height < 4) {
                throw std::invalid_argument(
                    std::format("RenderOptions: plot must be at least 8x4, got {}x{}",
                                o.width, o.height));
            }
        }

        inline std::vector<std::string> resolveLabels(const std::vector<std::string>& labels,
                                                      int n, const char* where) {
            if (labels.empty()) return assetLabels(n);
            if (static_cast<int>(labels.size()) != n) {
                throw std::invalid_argument(
                    std::format("{}: {} labels for {} assets", where, labels.size(), n));
            }
            return labels;
        }

        /// Closed interval mapped onto [0, cells - 1]
        struct Axis {
            double lo;
            double hi;
            int cells;

            Axis(double lo_, double hi_, int cells_) : lo(lo_), hi(hi_), cells(cells_) {
                if (!(hi > lo)) {
                    const double pad = std::max(1e-9, std::abs(lo) * 0.05);
                    lo -= pad;
                    hi += pad;
                }
            }

            int cell(double v) const {
                const double t = (v - lo) / (hi - lo);
                const int c = static_cast<int>(std::lround(t * (cells - 1)));
                return std::clamp(c, 0, cells - 1);
            }
        };

        /// Character grid; row 0 is the top line
        class Canvas {
            int width_;
            int height_;
            std::vector<std::string> rows_;

        public:
            Canvas(int width, int height)
                : width_(width), height_(height),
                  rows_(static_cast<std::size_t>(height), std::string(static_cast<std::size_t>(width), ' '))
            {
            }

            void put(int col, int row, char c) {
                if (col < 0 || col >= width_ || row < 0 || row >= height_) return;
                rows_[static_cast<std::size_t>(row)][static_cast<std::size_t>(col)] = c;
            }

            void line(int c0, int r0, int c1, int r1, char c) {
                const int steps = std::max(std::abs(c1 - c0), std::abs(r1 - r0));
                if (steps == 0) {
                    put(c0, r0, c);
                    return;
                }
                for (int s = 0; s <= steps; ++s) {
                    const double t = static_cast<double>(s) / steps;
                    put(static_cast<int>(std::lround(c0 + t * (c1 - c0))),
                        static_cast<int>(std::lround(r0 + t * (r1 - r0))), c);
                }
            }

            /// Rows with a y-axis: value labels on the top, middle and bottom rows
            void print(std::ostream& os, const Axis& y) const {
                for (int r = 0; r < height_; ++r) {
                    std::string label;
                    if (r == 0 || r == height_ - 1 || r == height_ / 2) {
                        const double v = y.hi - (y.hi - y.lo) * r / (height_ - 1);
                        label = std::format("{:9.4f}", v);
                    }
                    os << std::format("{:>9} |{}\n", label, rows_[static_cast<std::size_t>(r)]);
                }
            }

            void printXAxis(std::ostream& os, const Axis& x, const std::string& name) const {
                os << std::string(10, ' ') << '+' << std::string(static_cast<std::size_t>(width_), '-') << '\n';
                const std::string lo = std::format("{:.4f}", x.lo);
                const std::string hi = std::format("{:.4f}", x.hi);
                const int gap = std::max(1, width_ - static_cast<int>(lo.size() + hi.size()));
                os << std::string(11, ' ') << lo << std::string(static_cast<std::size_t>(gap), ' ') << hi << '\n';
                os << std::string(11, ' ')
                   << std::string(static_cast<std::size_t>(std::max(0, (width_ - static_cast<int>(name.size())) / 2)), ' ')
                   << name << '\n';
            }
        };

    } // namespace render_detail

    // ========================================================================
    // MARKET TABLE
    // ========================================================================

    inline void renderMarketTable(std::ostream& os, const MarketData& market) {
        const auto labels = render_detail::resolveLabels(market.labels, market.assetCount(),
                                                         "renderMarketTable");
        const Eigen::VectorXd sd = singleAssetRisk(market);

        os << std::format("{:<8} {:>10} {:>10}\n", "Asset", "Return", "Risk");
        os << std::string(30, '-') << '\n';
        for (int i = 0; i < market.assetCount(); ++i) {
            os << std::format("{:<8} {:>10.4f} {:>10.4f}\n", labels[static_cast<std::size_t>(i)],
                              market.mu(i), sd(i));
        }
    }

    // ========================================================================
    // RISK / RETURN PLOT
    // ========================================================================

    /**
     * @brief Frontier curve with single-asset points and marked samples
     * @details Each marker gets a caption line "@ sample 29: gamma = 0.2947".
     */
    inline void renderFrontier(std::ostream& os, const Frontier& frontier, const MarketData& market,
                               const std::vector<int>& markers, const RenderOptions& options = {}) {
        using namespace render_detail;
        checkOptions(options);
        checkSampleIndices(frontier, markers);

        const Eigen::VectorXd assetRisk = singleAssetRisk(market);

        double xlo = assetRisk.size() ? assetRisk.minCoeff() : 0.0;
        double xhi = assetRisk.size() ? assetRisk.maxCoeff() : 1.0;
        double ylo = market.mu.size() ? market.mu.minCoeff() : 0.0;
        double yhi = market.mu.size() ? market.mu.maxCoeff() : 1.0;
        for (const auto& p : frontier) {
            xlo = std::min(xlo, p.risk);
            xhi = std::max(xhi, p.risk);
            ylo = std::min(ylo, p.expectedReturn);
            yhi = std::max(yhi, p.expectedReturn);
        }

        const Axis x(xlo, xhi, options.width);
        const Axis y(ylo, yhi, options.height);
        auto row = [&](double v) { return options.height - 1 - y.cell(v); };

        Canvas canvas(options.width, options.height);
        for (int k = 1; k < frontier.size(); ++k) {
            const auto& a = frontier.at(k - 1);
            const auto& b = frontier.at(k);
            canvas.line(x.cell(a.risk), row(a.expectedReturn),
                        x.cell(b.risk), row(b.expectedReturn), '*');
        }
        if (frontier.size() == 1) {
            canvas.put(x.cell(frontier.at(0).risk), row(frontier.at(0).expectedReturn), '*');
        }
        for (int i = 0; i < market.assetCount(); ++i) {
            canvas.put(x.cell(assetRisk(i)), row(market.mu(i)), 'o');
        }
        for (int k : markers) {
            const auto& p = frontier.at(k);
            canvas.put(x.cell(p.risk), row(p.expectedReturn), '@');
        }

        os << "Risk / return trade-off\n\n";
        canvas.print(os, y);
        canvas.printXAxis(os, x, "risk (standard deviation)");
        os << "\n  * frontier   o single asset   @ marked sample\n";
        for (int k : markers) {
            os << std::format("  @ sample {}: gamma = {:.4g}\n", k, frontier.at(k).gamma);
        }
    }

    // ========================================================================
    // ALLOCATION BARS
    // ========================================================================

    /**
     * @brief Stacked bar of w per marked sample, asset 0 at the bottom
     * @param labels Asset labels; empty means "A0", "A1", ...
     */
    inline void renderAllocations(std::ostream& os, const Frontier& frontier,
                                  const std::vector<int>& markers,
                                  const std::vector<std::string>& labels = {},
                                  const RenderOptions& options = {}) {
        using namespace render_detail;
        checkOptions(options);
        checkSampleIndices(frontier, markers);

        os << "Fraction of budget per asset\n\n";
        if (markers.empty()) {
            os << "  (no samples selected)\n";
            return;
        }

        const int n = static_cast<int>(frontier.at(markers.front()).weights.size());
        const auto names = resolveLabels(labels, n, "renderAllocations");

        constexpr int kBarWidth = 7;
        constexpr int kGap = 3;
        const int h = options.height;

        // owner[b][r]: asset drawn at row r (0 = top) of bar b, -1 if empty
        std::vector<std::vector<int>> owner(markers.size(), std::vector<int>(static_cast<std::size_t>(h), -1));
        for (std::size_t b = 0; b < markers.size(); ++b) {
            const Eigen::VectorXd& w = frontier.at(markers[b]).weights;
            if (w.size() != n) {
                throw std::invalid_argument(
                    std::format("renderAllocations: sample {} has {} weights, expected {}",
                                markers[b], w.size(), n));
            }
            const double total = std::max(w.cwiseMax(0.0).sum(), 1e-12);
            for (int r = 0; r < h; ++r) {
                const double level = (h - r - 0.5) / h;
                double cum = 0.0;
                for (int i = 0; i < n; ++i) {
                    cum += std::max(0.0, w(i)) / total;
                    if (cum > level) {
                        owner[b][static_cast<std::size_t>(r)] = i;
                        break;
                    }
                }
            }
        }

        for (int r = 0; r < h; ++r) {
            std::string label;
            if (r == 0) label = "100%";
            else if (r == h / 2) label = "50%";
            else if (r == h - 1) label = "0%";
            os << std::format("{:>5} |", label);
            for (std::size_t b = 0; b < markers.size(); ++b) {
                os << std::string(kGap, ' ');
                const int asset = owner[b][static_cast<std::size_t>(r)];
                for (int c = 0; c < kBarWidth; ++c) {
                    os << (asset < 0 ? std::string(1, ' ') : colored(allocGlyph(asset), asset, options.useColor));
                }
            }
            os << '\n';
        }

        os << "      +" << std::string(markers.size() * (kBarWidth + kGap) + 1, '-') << '\n';
        os << "       ";
        for (int k : markers) {
            os << std::string(kGap, ' ') << std::format("{:^{}}", std::format("{:.3g}", frontier.at(k).gamma), kBarWidth);
        }
        os << "\n       " << std::string(kGap, ' ') << "gamma\n\n";

        for (int i = 0; i < n; ++i) {
            os << "  " << colored(allocGlyph(i), i, options.useColor) << ' '
               << names[static_cast<std::size_t>(i)];
            os << ((i + 1) % 5 == 0 || i + 1 == n ? "\n" : "   ");
        }
    }

    // ========================================================================
    // RETURN DISTRIBUTIONS
    // ========================================================================

    /**
     * @brief Normal return density of each marked portfolio
     * @details Curves are numbered 1..9 in marker order (then wrap).
     */
    inline void renderReturnDistributions(std::ostream& os, const Frontier& frontier,
                                          const std::vector<int>& markers,
                                          const RenderOptions& options = {}) {
        using namespace render_detail;
        checkOptions(options);
        checkSampleIndices(frontier, markers);

        os << "Return distributions\n\n";
        if (markers.empty()) {
            os << "  (no samples selected)\n";
            return;
        }

        double xlo = 0.0, xhi = 0.0, peak = 0.0;
        bool first = true;
        for (int k : markers) {
            const auto& p = frontier.at(k);
            const double s = std::max(p.risk, 1e-6);
            xlo = first ? p.expectedReturn - 3 * s : std::min(xlo, p.expectedReturn - 3 * s);
            xhi = first ? p.expectedReturn + 3 * s : std::max(xhi, p.expectedReturn + 3 * s);
            peak = std::max(peak, 1.0 / (s * std::sqrt(2.0 * std::numbers::pi)));
            first = false;
        }

        const Axis x(xlo, xhi, options.width);
        const Axis y(0.0, peak, options.height);

        Canvas canvas(options.width, options.height);
        for (std::size_t m = 0; m < markers.size(); ++m) {
            const auto& p = frontier.at(markers[m]);
            const double s = std::max(p.risk, 1e-6);
            const char glyph = static_cast<char>('1' + static_cast<int>(m % 9));

            int prevCol = -1, prevRow = -1;
            for (int c = 0; c < options.width; ++c) {
                const double v = x.lo + (x.hi - x.lo) * c / (options.width - 1);
                const double z = (v - p.expectedReturn) / s;
                const double density = std::exp(-0.5 * z * z) / (s * std::sqrt(2.0 * std::numbers::pi));
                const int r = options.height - 1 - y.cell(density);
                if (prevCol >= 0) canvas.line(prevCol, prevRow, c, r, glyph);
                prevCol = c;
                prevRow = r;
            }
        }

        canvas.print(os, y);
        canvas.printXAxis(os, x, "return");
        os << '\n';
        for (std::size_t m = 0; m < markers.size(); ++m) {
            const auto& p = frontier.at(markers[m]);
            os << std::format("  {} gamma = {:.4g}: return {:.4f}, risk {:.4f}\n",
                              static_cast<char>('1' + static_cast<int>(m % 9)),
                              p.gamma, p.expectedReturn, p.risk);
        }
    }

    // ========================================================================
    // CSV
    // ========================================================================

    /**
     * @brief "gamma,return,risk,<label>..." then one row per sample
     * @param labels Column names of the weights; empty means "A0", "A1", ...
     */
    inline void writeFrontierCsv(std::ostream& os, const Frontier& frontier,
                                 const std::vector<std::string>& labels = {}) {
        const int n = frontier.empty() ? static_cast<int>(labels.size())
                                       : static_cast<int>(frontier.at(0).weights.size());
        const auto names = render_detail::resolveLabels(labels, n, "writeFrontierCsv");

        os << "gamma,return,risk";
        for (const auto& name : names) os << ',' << name;
        os << '\n';

        for (const auto& p : frontier) {
            if (p.weights.size() != n) {
                throw std::invalid_argument(
                    std::format("writeFrontierCsv: {} weights, expected {}", p.weights.size(), n));
            }
            os << std::format("{:.10g},{:.10g},{:.10g}", p.gamma, p.expectedReturn, p.risk);
            for (int i = 0; i < n; ++i) os << std::format(",{:.10g}", p.weights(i));
            os << '\n';
        }
    }

} // namespace markowitz
