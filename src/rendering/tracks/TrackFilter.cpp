#include "rendering/tracks/TrackFilter.h"

#include "common/Exception.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

namespace
{

const std::string sk_currentTime("u_currentTime");
const std::string sk_currentDepth("u_currentDepth");
const std::string sk_hasCurrentDepth("u_hasCurrentDepth");
const std::string sk_tailLength("u_tailLength");
const std::string sk_headLength("u_headLength");
const std::string sk_useFade("u_useFade");
const std::string sk_interactive("u_interactive");

void checkWindowLength(float length, const char* name)
{
  if (!std::isfinite(length) || length < 0.0f)
  {
    const std::string msg = fmt::format("Invalid track {} length {}: must be finite and non-negative", name, length);
    spdlog::error(msg);
    throw_debug(msg)
  }
}

} // namespace

TrackFilter::TrackFilter()
  : TrackFilter(tracks::TrackShadingParams{})
{
}

TrackFilter::TrackFilter(const tracks::TrackShadingParams& params)
  : m_params()
  , m_uniforms(createUniforms())
{
  checkWindowLength(params.tailLength, "tail");
  checkWindowLength(params.headLength, "head");

  m_params = params;
  syncAllUniforms();
}

Uniforms TrackFilter::createUniforms()
{
  const tracks::TrackShadingParams defaults;

  Uniforms uniforms;
  uniforms.insertUniform(sk_currentTime, UniformType::Float, defaults.currentTime);
  uniforms.insertUniform(sk_currentDepth, UniformType::Float, defaults.currentDepth.value_or(0.0f));
  uniforms.insertUniform(sk_hasCurrentDepth, UniformType::Bool, defaults.currentDepth.has_value());
  uniforms.insertUniform(sk_tailLength, UniformType::Float, defaults.tailLength);
  uniforms.insertUniform(sk_headLength, UniformType::Float, defaults.headLength);
  uniforms.insertUniform(sk_useFade, UniformType::Bool, defaults.useFade);
  uniforms.insertUniform(sk_interactive, UniformType::Bool, defaults.interactive);
  return uniforms;
}

void TrackFilter::setCurrentTime(float time)
{
  m_params.currentTime = time;
  m_uniforms.setValue(sk_currentTime, time);
}

bool TrackFilter::setCurrentTimeToLatest(const TrackVertexAttributes& attributes)
{
  const auto latest = attributes.maxTime();

  if (!latest)
  {
    spdlog::warn("Cannot set current time to latest vertex time: there are no track vertices");
    return false;
  }

  setCurrentTime(*latest);
  return true;
}

void TrackFilter::setCurrentDepth(std::optional<float> depth)
{
  m_params.currentDepth = depth;

  // The depth value is left unchanged when cleared, since shaders ignore it
  if (depth)
  {
    m_uniforms.setValue(sk_currentDepth, *depth);
  }

  m_uniforms.setValue(sk_hasCurrentDepth, depth.has_value());
}

void TrackFilter::setTailLength(float length)
{
  checkWindowLength(length, "tail");
  m_params.tailLength = length;
  m_uniforms.setValue(sk_tailLength, length);
}

void TrackFilter::setHeadLength(float length)
{
  checkWindowLength(length, "head");
  m_params.headLength = length;
  m_uniforms.setValue(sk_headLength, length);
}

void TrackFilter::setUseFade(bool useFade)
{
  m_params.useFade = useFade;
  m_uniforms.setValue(sk_useFade, useFade);
}

void TrackFilter::setInteractive(bool interactive)
{
  m_params.interactive = interactive;
  m_uniforms.setValue(sk_interactive, interactive);
}

const tracks::TrackShadingParams& TrackFilter::params() const
{
  return m_params;
}

const Uniforms& TrackFilter::uniforms() const
{
  return m_uniforms;
}

Uniforms& TrackFilter::uniforms()
{
  return m_uniforms;
}

std::vector<TrackFilter::UniformUpload> TrackFilter::pendingUploads() const
{
  std::vector<UniformUpload> uploads;

  for (const auto& name : m_uniforms.dirtyUniformNames())
  {
    uploads.emplace_back(name, m_uniforms.value(name));
  }

  return uploads;
}

std::vector<float> TrackFilter::computeAlphas(const TrackVertexAttributes& attributes) const
{
  const auto& times = attributes.vertexTime();
  const auto& depths = attributes.vertexDepth();

  std::vector<float> alphas(attributes.size());

  for (std::size_t i = 0; i < alphas.size(); ++i)
  {
    alphas[i] = tracks::computeVertexAlpha(times[i], depths[i], m_params);
  }

  return alphas;
}

std::vector<float> TrackFilter::computeSizeFactors(const TrackVertexAttributes& attributes) const
{
  const auto& depths = attributes.vertexDepth();

  std::vector<float> sizes(attributes.size());

  for (std::size_t i = 0; i < sizes.size(); ++i)
  {
    sizes[i] = tracks::computeVertexSizeFactor(depths[i], m_params);
  }

  return sizes;
}

void TrackFilter::syncAllUniforms()
{
  m_uniforms.setValue(sk_currentTime, m_params.currentTime);

  if (m_params.currentDepth)
  {
    m_uniforms.setValue(sk_currentDepth, *m_params.currentDepth);
  }

  m_uniforms.setValue(sk_hasCurrentDepth, m_params.currentDepth.has_value());
  m_uniforms.setValue(sk_tailLength, m_params.tailLength);
  m_uniforms.setValue(sk_headLength, m_params.headLength);
  m_uniforms.setValue(sk_useFade, m_params.useFade);
  m_uniforms.setValue(sk_interactive, m_params.interactive);
}
