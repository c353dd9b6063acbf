/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// --------------------------------------------------------------------------
/*! \file
 *  \brief базовые вспомогательные функции библиотеки devvisor
*/
// --------------------------------------------------------------------------
#ifndef VisorTypes_H_
#define VisorTypes_H_
// --------------------------------------------------------------------------
#include <string>
#include <map>
#include <ctime>
// --------------------------------------------------------------------------
namespace devvisor
{
    /*! Строгое преобразование: вся строка (без пробелов по краям) должна быть десятичным числом.
     * \return false если строка пустая, содержит лишние символы или выходит за пределы int
     */
    bool str_to_int( const std::string& str, int& result ) noexcept;

    //! Удаление пробельных символов (включая \r\n) в начале и в конце строки
    std::string trim( const std::string& s );

    /*! Подстановка ${VAR} и $VAR.
     * Значение ищется сначала в vars, затем в окружении процесса. Неизвестные переменные заменяются пустой строкой.
     */
    std::string expand_vars( const std::string& s, const std::map<std::string, std::string>& vars = {} );

    struct timespec now_to_timespec(); /*!< получение текущего времени */
}
// --------------------------------------------------------------------------
#endif // VisorTypes_H_
// --------------------------------------------------------------------------
