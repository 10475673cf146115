#include "rbg-gui/src/WireframeRenderer.hpp"

#include <array>
#include <cmath>
#include <numbers>
#include <vector>

namespace rbg_gui
{

void WireframeRenderer::render(SDL_Renderer* renderer,
                               const rbg_sim::Engine& engine,
                               int width,
                               int height) const
{
  setColor(renderer, kBackground);
  SDL_RenderClear(renderer);

  ViewProjection const projection{engine.getCamera(), width, height};

  const auto& scene = engine.getScene();
  const auto& registry = engine.getRegistry();

  for (const auto& [id, node] : scene.getNodes())
  {
    if (!node.mesh)
    {
      continue;
    }

    setColor(renderer,
             isUnderGoal(scene, registry, id) ? kGoalColor : kLevelColor);
    drawMesh(renderer, projection, *node.mesh, scene.getWorldTransform(id));
  }

  drawBall(renderer, projection, engine);
}

void WireframeRenderer::setColor(SDL_Renderer* renderer, rbg_sim::Color color)
{
  SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
}

void WireframeRenderer::drawMesh(SDL_Renderer* renderer,
                                 const ViewProjection& projection,
                                 const rbg_sim::MeshData& mesh,
                                 const Eigen::Affine3d& world)
{
  std::vector<std::optional<Eigen::Vector2f>> screen;
  screen.reserve(mesh.vertices.size());
  for (const auto& vertex : mesh.vertices)
  {
    screen.push_back(projection.toScreen(world * vertex));
  }

  auto drawEdge = [&](uint32_t a, uint32_t b)
  {
    if (a >= screen.size() || b >= screen.size() || !screen[a] || !screen[b])
    {
      return;
    }
    SDL_RenderLine(renderer,
                   screen[a]->x(),
                   screen[a]->y(),
                   screen[b]->x(),
                   screen[b]->y());
  };

  for (size_t i = 0; i + 2 < mesh.indices.size(); i += 3)
  {
    drawEdge(mesh.indices[i], mesh.indices[i + 1]);
    drawEdge(mesh.indices[i + 1], mesh.indices[i + 2]);
    drawEdge(mesh.indices[i + 2], mesh.indices[i]);
  }
}

void WireframeRenderer::drawBall(SDL_Renderer* renderer,
                                 const ViewProjection& projection,
                                 const rbg_sim::Engine& engine)
{
  auto ball = engine.getRegistry().getBall();
  if (!ball || !engine.getScene().contains(ball->get().node))
  {
    return;
  }

  auto const center = engine.getScene().getWorldPosition(ball->get().node);
  auto const screenCenter = projection.toScreen(center);
  if (!screenCenter)
  {
    return;
  }

  float const radius =
    projection.projectedRadius(ball->get().radius, projection.depthOf(center));

  std::array<SDL_FPoint, kCircleSegments + 1> points{};
  for (size_t i = 0; i <= kCircleSegments; ++i)
  {
    float const angle = 2.0f * std::numbers::pi_v<float> *
                        static_cast<float>(i) /
                        static_cast<float>(kCircleSegments);
    points[i] = SDL_FPoint{screenCenter->x() + radius * std::cos(angle),
                           screenCenter->y() + radius * std::sin(angle)};
  }

  setColor(renderer, kBallColor);
  SDL_RenderLines(renderer, points.data(), static_cast<int>(points.size()));
}

bool WireframeRenderer::isUnderGoal(const rbg_sim::SceneGraph& scene,
                                    const rbg_sim::WorldRegistry& registry,
                                    rbg_sim::NodeId id)
{
  std::optional<rbg_sim::NodeId> current = id;
  while (current)
  {
    if (registry.isGoal(*current))
    {
      return true;
    }
    current = scene.getNode(*current).parent;
  }
  return false;
}

}  // namespace rbg_gui
