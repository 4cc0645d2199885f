#include "rendering/TrackDrawing.h"

#include "logic/tracks/TrackLineData.h"
#include "rendering/tracks/TrackFilter.h"

#include "common/Exception.hpp"

#include <cmrc/cmrc.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

CMRC_DECLARE(shaders);


namespace
{

static const glm::mat4 sk_identMat4{1.0f};

} // namespace


TrackDrawing::TrackDrawing()
  : m_program(nullptr)
  , m_vao()
  , m_positionsBuffer(BufferType::VertexArray, BufferUsagePattern::StaticDraw)
  , m_colorsBuffer(BufferType::VertexArray, BufferUsagePattern::StaticDraw)
  , m_vertexTimeBuffer(BufferType::VertexArray, BufferUsagePattern::StaticDraw)
  , m_vertexDepthBuffer(BufferType::VertexArray, BufferUsagePattern::StaticDraw)
  , m_indicesBuffer(BufferType::Index, BufferUsagePattern::StaticDraw)
  , m_drawParams()
  , m_lineWidth(1.0f)
  , m_errorChecker()
{
}

void TrackDrawing::initialize()
{
  if (!createProgram())
  {
    throw_debug("Failed to create track shader program")
  }

  m_vao.generate();
  m_positionsBuffer.generate();
  m_colorsBuffer.generate();
  m_vertexTimeBuffer.generate();
  m_vertexDepthBuffer.generate();
  m_indicesBuffer.generate();

  spdlog::debug("Initialized track drawing");
}

bool TrackDrawing::createProgram()
{
  static const std::string vsFileName{"src/rendering/shaders/Tracks.vs"};
  static const std::string fsFileName{"src/rendering/shaders/Tracks.fs"};

  auto filesystem = cmrc::shaders::get_filesystem();
  std::string vsSource;
  std::string fsSource;

  try
  {
    cmrc::file vsData = filesystem.open(vsFileName.c_str());
    cmrc::file fsData = filesystem.open(fsFileName.c_str());

    vsSource = std::string(vsData.begin(), vsData.end());
    fsSource = std::string(fsData.begin(), fsData.end());
  }
  catch (const std::exception& e)
  {
    spdlog::critical("Exception when loading shader file: {}", e.what());
    throw_debug("Unable to load shader")
  }

  auto program = std::make_unique<GLShaderProgram>("TracksProgram");

  {
    Uniforms vsUniforms = TrackFilter::createUniforms();
    vsUniforms.insertUniform("u_clip_T_world", UniformType::Mat4, sk_identMat4);

    auto vs = std::make_shared<GLShader>("vsTracks", ShaderType::Vertex, vsSource.c_str());
    vs->setRegisteredUniforms(std::move(vsUniforms));
    program->attachShader(vs);

    spdlog::debug("Compiled vertex shader {}", vsFileName);
  }

  {
    auto fs = std::make_shared<GLShader>("fsTracks", ShaderType::Fragment, fsSource.c_str());
    program->attachShader(fs);

    spdlog::debug("Compiled fragment shader {}", fsFileName);
  }

  if (!program->link())
  {
    spdlog::critical("Failed to link shader program {}", program->name());
    return false;
  }

  spdlog::debug("Linked shader program {}", program->name());
  program->logActiveVariables();

  m_program = std::move(program);
  return true;
}

void TrackDrawing::setLineData(const TrackLineData& data)
{
  const std::size_t numVertices = data.numVertices();

  if (data.m_colors.size() != numVertices || data.m_attributes.size() != numVertices)
  {
    spdlog::error("Track line data has {} positions, {} colors, and {} vertex attributes",
                  numVertices, data.m_colors.size(), data.m_attributes.size());
    throw_debug("Shape mismatch in track line data")
  }

  const auto* times = data.m_attributes.vertexTime().data();
  const auto* depths = data.m_attributes.vertexDepth().data();

  m_positionsBuffer.allocate(numVertices * sizeof(glm::vec3), data.m_positions.data());
  m_colorsBuffer.allocate(numVertices * sizeof(glm::vec4), data.m_colors.data());
  m_vertexTimeBuffer.allocate(numVertices * sizeof(float), times);
  m_vertexDepthBuffer.allocate(numVertices * sizeof(float), depths);

  m_vao.bind();
  {
    m_positionsBuffer.bind();
    m_vao.setAttributeBuffer(msk_positionIndex, 3, BufferComponentType::Float, false, 0, 0);
    m_vao.enableVertexAttribute(msk_positionIndex);

    m_colorsBuffer.bind();
    m_vao.setAttributeBuffer(msk_colorIndex, 4, BufferComponentType::Float, false, 0, 0);
    m_vao.enableVertexAttribute(msk_colorIndex);

    m_vertexTimeBuffer.bind();
    m_vao.setAttributeBuffer(msk_vertexTimeIndex, 1, BufferComponentType::Float, false, 0, 0);
    m_vao.enableVertexAttribute(msk_vertexTimeIndex);

    m_vertexDepthBuffer.bind();
    m_vao.setAttributeBuffer(msk_vertexDepthIndex, 1, BufferComponentType::Float, false, 0, 0);
    m_vao.enableVertexAttribute(msk_vertexDepthIndex);

    // The index buffer binding is recorded in the VAO: bind it again after allocation
    m_indicesBuffer.allocate(data.m_segmentIndices.size() * sizeof(uint32_t), data.m_segmentIndices.data());
    m_indicesBuffer.bind();
  }
  m_vao.release();

  CHECK_GL_ERROR(m_errorChecker)

  m_drawParams.primitiveMode = PrimitiveMode::Lines;
  m_drawParams.elementCount = data.m_segmentIndices.size();
  m_drawParams.indexType = IndexType::UInt32;
  m_drawParams.indexOffset = 0;

  spdlog::debug("Uploaded {} track vertices and {} segments", numVertices, data.numSegments());
}

void TrackDrawing::render(TrackFilter& filter, const glm::mat4& clip_T_world)
{
  if (!m_program || 0 == m_drawParams.elementCount)
  {
    return;
  }

  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
  glLineWidth(m_lineWidth);

  m_program->use();
  {
    m_program->applyUniforms(filter.uniforms());
    m_program->setUniform("u_clip_T_world", clip_T_world);

    m_vao.bind();
    m_vao.drawElements(m_drawParams);
    m_vao.release();
  }
  m_program->stopUse();

  CHECK_GL_ERROR(m_errorChecker)
}

void TrackDrawing::setLineWidth(float width)
{
  m_lineWidth = std::max(width, 1.0f);
}

std::size_t TrackDrawing::numSegments() const
{
  return m_drawParams.elementCount / 2;
}
