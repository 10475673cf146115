#ifndef RBG_GUI_WIREFRAME_RENDERER_HPP
#define RBG_GUI_WIREFRAME_RENDERER_HPP

#include <cstddef>

#include <SDL3/SDL.h>

#include "rbg-gui/src/ViewProjection.hpp"
#include "rbg-sim/src/Engine.hpp"
#include "rbg-sim/src/Services/TextOverlay.hpp"

namespace rbg_gui
{

/**
 * @brief Draws the game world as wireframe lines through the SDL renderer
 *
 * Every scene node with a mesh is drawn triangle edge by triangle edge; an
 * edge with an endpoint behind the near plane is skipped. Meshes under a goal
 * node use the goal color. The ball is drawn as a projected circle.
 */
class WireframeRenderer
{
public:
  static constexpr size_t kCircleSegments = 32;

  static constexpr rbg_sim::Color kBackground{18, 20, 28, 255};
  static constexpr rbg_sim::Color kLevelColor{170, 180, 200, 255};
  static constexpr rbg_sim::Color kGoalColor{250, 210, 60, 255};
  static constexpr rbg_sim::Color kBallColor{90, 200, 255, 255};

  /**
   * @brief Clear the target and draw the world seen from the engine camera
   */
  void render(SDL_Renderer* renderer,
              const rbg_sim::Engine& engine,
              int width,
              int height) const;

private:
  static void setColor(SDL_Renderer* renderer, rbg_sim::Color color);

  static void drawMesh(SDL_Renderer* renderer,
                       const ViewProjection& projection,
                       const rbg_sim::MeshData& mesh,
                       const Eigen::Affine3d& world);

  static void drawBall(SDL_Renderer* renderer,
                       const ViewProjection& projection,
                       const rbg_sim::Engine& engine);

  [[nodiscard]] static bool isUnderGoal(const rbg_sim::SceneGraph& scene,
                                        const rbg_sim::WorldRegistry& registry,
                                        rbg_sim::NodeId id);
};

}  // namespace rbg_gui

#endif  // RBG_GUI_WIREFRAME_RENDERER_HPP
