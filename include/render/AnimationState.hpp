/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ANIMATION_STATE_HPP
#define ANIMATION_STATE_HPP

/**
 * @file AnimationState.hpp
 * @brief Render-only animation: drifting clouds, water and river phase
 *
 * Nothing here is game state. Clouds live in a fixed-size array, so there
 * are always exactly CLOUD_COUNT of them; a cloud that drifts past the right
 * edge is replaced in its slot by a fresh one starting left of the canvas.
 *
 * Wave and river phases are pure functions of wall-clock time while their
 * toggle is on, and 0 while it is off.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

namespace Wayfarer {

struct AnimationSettings {
    bool cloudsEnabled{false};
    bool wavesEnabled{false};
    bool riverEnabled{false};

    bool operator==(const AnimationSettings&) const = default;
};

// Partial update; unset fields keep their current value
struct AnimationSettingsPatch {
    std::optional<bool> cloudsEnabled{};
    std::optional<bool> wavesEnabled{};
    std::optional<bool> riverEnabled{};
};

struct Cloud {
    float x{0.0f};
    float y{0.0f};
    float speed{0.0f};    // Pixels per animation update
    float size{0.0f};
    float opacity{0.0f};
};

class AnimationState {
public:
    static constexpr size_t CLOUD_COUNT = 8;
    static constexpr float MIN_CLOUD_SPEED = 0.05f;
    static constexpr float MAX_CLOUD_SPEED = 0.2f;
    static constexpr int64_t UPDATE_INTERVAL_MS = 16;
    static constexpr double WAVE_PERIOD_DIVISOR_MS = 1000.0;
    static constexpr double RIVER_PERIOD_DIVISOR_MS = 800.0;

    using CloudArray = std::array<Cloud, CLOUD_COUNT>;

    /**
     * @param seed 0 picks a random seed
     */
    AnimationState(int canvasWidth, int canvasHeight, uint32_t seed = 0);

    /**
     * @brief Advance animations if at least UPDATE_INTERVAL_MS has passed
     * since the last advance
     * @return true if anything was advanced
     */
    bool tick(int64_t nowMs);

    // Advance unconditionally (clouds drift one step, phases follow nowMs)
    void advance(int64_t nowMs);

    void applySettings(const AnimationSettingsPatch& patch);

    /**
     * @brief New canvas size; clouds are re-seeded across the new width
     */
    void resize(int canvasWidth, int canvasHeight);

    [[nodiscard]] const AnimationSettings& getSettings() const { return m_settings; }
    [[nodiscard]] const CloudArray& getClouds() const { return m_clouds; }
    [[nodiscard]] double getWaveOffset() const { return m_waveOffset; }
    [[nodiscard]] double getRiverOffset() const { return m_riverOffset; }
    [[nodiscard]] int getCanvasWidth() const { return m_canvasWidth; }
    [[nodiscard]] int getCanvasHeight() const { return m_canvasHeight; }
    [[nodiscard]] uint64_t getCloudsRecycled() const { return m_cloudsRecycled; }

private:
    Cloud createCloud(size_t index, bool forceOffscreen);
    void initializeClouds();
    void updateClouds();
    float random01() { return m_unit(m_rng); }

    int m_canvasWidth;
    int m_canvasHeight;
    AnimationSettings m_settings{};
    CloudArray m_clouds{};
    double m_waveOffset{0.0};
    double m_riverOffset{0.0};
    std::optional<int64_t> m_lastUpdateMs{};
    uint64_t m_cloudsRecycled{0};

    std::mt19937 m_rng;
    std::uniform_real_distribution<float> m_unit{0.0f, 1.0f};
};

} // namespace Wayfarer

#endif // ANIMATION_STATE_HPP
