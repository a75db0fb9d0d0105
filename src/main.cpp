#include "pipeline.hpp"
#include "modules/audio_module.hpp"
#include "modules/board_module.hpp"
#include "modules/debug_module.hpp"
#include "modules/event_bus_module.hpp"
#include "modules/input_module.hpp"
#include "modules/render_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>

static const char* AUDIO_CONFIG_PATH = "resources/audio.json";

int main() {
  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT);
  InitWindow(900, 1000, "Xiangqi");
  SetTargetFPS(60);

  ecs::World world;
  ecs::Pipeline pipeline;

  // Order matters:
  //   EventBus first (flush + queues), Debug before modules adding rows,
  //   Board before Audio (PieceActionEvent), Render then overlay then present.
  EventBusModule::install(world, pipeline);
  DebugModule::install(world, pipeline);
  InputModule::install(world, pipeline);
  BoardModule::install(world, pipeline);
  AudioModule::install(world, pipeline, AUDIO_CONFIG_PATH);
  RenderModule::install(world, pipeline);
  DebugModule::install_overlay(world, pipeline);
  RenderModule::install_present(world, pipeline);

  // --- Main Loop ---
  while (!WindowShouldClose()) {
    pipeline.update(world, GetFrameTime());
    pipeline.render(world);
  }

  AudioModule::shutdown(world);
  RenderModule::shutdown(world);
  CloseWindow();
  return 0;
}
