// GLSL program used by the preview window to draw the frame texture.

#pragma once

#include <glad/glad.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

class ShaderProgram
{
public:
    ShaderProgram() = default;

    ShaderProgram(const std::string& vertexSource,
                  const std::string& fragmentSource)
    {
        const Stage vertex(GL_VERTEX_SHADER, vertexSource);
        const Stage fragment(GL_FRAGMENT_SHADER, fragmentSource);
        link(vertex.handle, fragment.handle);
    }

    // Reads both stages from disk; a missing file is reported by path.
    static ShaderProgram fromFiles(const std::string& vertexPath,
                                   const std::string& fragmentPath)
    {
        return ShaderProgram(readSource(vertexPath), readSource(fragmentPath));
    }

    ~ShaderProgram()
    {
        release();
    }

    ShaderProgram(const ShaderProgram&) = delete;
    ShaderProgram& operator=(const ShaderProgram&) = delete;

    ShaderProgram(ShaderProgram&& other) noexcept
        : id_(other.id_)
    {
        other.id_ = 0;
    }

    ShaderProgram& operator=(ShaderProgram&& other) noexcept
    {
        if (this != &other)
        {
            release();
            id_ = other.id_;
            other.id_ = 0;
        }
        return *this;
    }

    void use() const
    {
        glUseProgram(id_);
    }

    // Points a sampler uniform at a texture unit. The program must be in use.
    void bindSampler(const char* name, GLint unit) const
    {
        const GLint location = glGetUniformLocation(id_, name);
        if (location >= 0)
        {
            glUniform1i(location, unit);
        }
    }

    void release()
    {
        if (id_ != 0)
        {
            glDeleteProgram(id_);
            id_ = 0;
        }
    }

private:
    // Compiled shader object, deleted once linked into the program.
    struct Stage
    {
        Stage(GLenum type, const std::string& source)
            : handle(glCreateShader(type))
        {
            const char* text = source.c_str();
            glShaderSource(handle, 1, &text, nullptr);
            glCompileShader(handle);

            GLint compiled = GL_FALSE;
            glGetShaderiv(handle, GL_COMPILE_STATUS, &compiled);
            if (compiled != GL_TRUE)
            {
                GLint length = 0;
                glGetShaderiv(handle, GL_INFO_LOG_LENGTH, &length);
                std::string log(static_cast<size_t>(length), '\0');
                glGetShaderInfoLog(handle, length, nullptr, log.data());
                glDeleteShader(handle);

                const char* kind = type == GL_VERTEX_SHADER ? "vertex" : "fragment";
                throw std::runtime_error(std::string("Failed to compile ") + kind + " shader: " + log);
            }
        }

        ~Stage()
        {
            glDeleteShader(handle);
        }

        Stage(const Stage&) = delete;
        Stage& operator=(const Stage&) = delete;

        GLuint handle;
    };

    void link(GLuint vertex, GLuint fragment)
    {
        id_ = glCreateProgram();
        glAttachShader(id_, vertex);
        glAttachShader(id_, fragment);
        glLinkProgram(id_);
        glDetachShader(id_, vertex);
        glDetachShader(id_, fragment);

        GLint linked = GL_FALSE;
        glGetProgramiv(id_, GL_LINK_STATUS, &linked);
        if (linked != GL_TRUE)
        {
            GLint length = 0;
            glGetProgramiv(id_, GL_INFO_LOG_LENGTH, &length);
            std::string log(static_cast<size_t>(length), '\0');
            glGetProgramInfoLog(id_, length, nullptr, log.data());
            release();
            throw std::runtime_error("Failed to link preview shader: " + log);
        }
    }

    static std::string readSource(const std::string& path)
    {
        std::ifstream file(path);
        if (!file)
        {
            throw std::runtime_error("Failed to open shader file: " + path);
        }
        std::ostringstream text;
        text << file.rdbuf();
        return text.str();
    }

    GLuint id_ = 0;
};
