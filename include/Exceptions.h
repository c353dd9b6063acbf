/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// --------------------------------------------------------------------------
/*! \file
 *  \brief Иерархия генерируемых библиотекой исключений
*/
// --------------------------------------------------------------------------
#ifndef Exceptions_h_
#define Exceptions_h_
// ---------------------------------------------------------------------------
#include <ostream>
#include <iostream>
#include <string>
#include <exception>
// ---------------------------------------------------------------------
namespace devvisor
{
    /**
      @defgroup DevVisorExceptions Исключения
      @{
    */

    /*!
        Базовый класс для всех исключений в библиотеке devvisor
        \note Все вновь создаваемые исключения обязаны наследоваться от него или его потомков
    */
    class Exception:
        public std::exception
    {
        public:

            Exception(const std::string& txt) noexcept: text(txt) {}
            Exception() noexcept: text("Exception") {}
            virtual ~Exception() noexcept(true) {}

            friend std::ostream& operator<<(std::ostream& os, const Exception& ex )
            {
                os << ex.text;
                return os;
            }

            virtual const char* what() const noexcept override
            {
                return text.c_str();
            }

        protected:
            const std::string text;
    };

    /*! Системные ошибки */
    class SystemError: public Exception
    {
        public:
            SystemError() noexcept: Exception("SystemError") {}

            /*! Конструктор, позволяющий вывести в сообщении об ошибке дополнительную информацию err */
            SystemError(const std::string& err) noexcept: Exception(err) {}
    };

    /*! Файл или узел не найден (или не может быть разобран) */
    class NameNotFound: public Exception
    {
        public:
            NameNotFound() noexcept: Exception("NameNotFound") {}
            NameNotFound(const std::string& err) noexcept: Exception(err) {}
    };

    /*!
        Ошибка конфигурации: файл отсутствует или некорректен,
        неверный порт, повторяющиеся порты или имена.
        Фатальна: ни один сервис не запускается.
    */
    class ConfigError: public Exception
    {
        public:
            ConfigError() noexcept: Exception("ConfigError") {}
            ConfigError(const std::string& err) noexcept: Exception(err) {}
    };

    /*!
        Ошибка запуска одного сервиса.
        Сервис пропускается, остальные продолжают запускаться.
    */
    class LaunchError: public Exception
    {
        public:
            enum Kind
            {
                NotFound,    /*!< точка входа сервиса не найдена на диске */
                SpawnFailed, /*!< не удалось создать процесс */
                Duplicate    /*!< имя или порт уже зарегистрированы */
            };

            LaunchError( Kind k, const std::string& err ) noexcept: Exception(err), k_(k) {}

            Kind kind() const noexcept
            {
                return k_;
            }

        private:
            Kind k_;
    };

    /*! Ошибка освобождения порта (только для журнала, наружу не выходит) */
    class PortReclaimError: public SystemError
    {
        public:
            PortReclaimError() noexcept: SystemError("PortReclaimError") {}
            PortReclaimError(const std::string& err) noexcept: SystemError(err) {}
    };

    std::string to_string( LaunchError::Kind k );

    //@}
    // end of DevVisorExceptions group
    // ---------------------------------------------------------------------
}   // end of devvisor namespace
// ---------------------------------------------------------------------
#endif // Exception_h_
// ---------------------------------------------------------------------
